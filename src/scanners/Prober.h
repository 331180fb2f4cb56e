#pragma once
#include "../core/Cidr.h"
#include "../core/Device.h"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lan_scan {

enum class ScanMethod { Auto, ScanL2, ScanDiscovery, Ping };

// Accepts the canonical names plus arp-scan / nmap / scan_l2 / scan_discovery.
std::optional<ScanMethod> parse_scan_method(const std::string& s);
const char* scan_method_to_string(ScanMethod m);

struct ProbeRequest {
    Ipv4Network cidr;
    std::string interface; // may be empty when the owning interface is unknown
    bool include_offline = false;
    double timeout_per_host = 0.8; // seconds
};

struct ProbeSuccess { std::vector<DeviceRecord> devices; };
struct ProbeUnavailable { std::string reason; };
struct ProbeFailed { std::string reason; };
using ProbeOutcome = std::variant<ProbeSuccess, ProbeUnavailable, ProbeFailed>;

// One host-discovery backend. probe() never throws for tool problems; it
// reports them through the outcome so the selector can fall through.
class Prober {
public:
    virtual ~Prober() = default;
    virtual std::string name() const = 0;
    virtual ScanMethod method() const = 0;
    // Executable lookup only; nothing is run.
    virtual bool available() const = 0;
    virtual ProbeOutcome probe(const ProbeRequest& req) = 0;
};

using ProberPtr = std::unique_ptr<Prober>;

}
