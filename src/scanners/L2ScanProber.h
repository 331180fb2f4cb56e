#pragma once
#include "Prober.h"
#include "../core/CommandRunner.h"

namespace lan_scan {

// Layer-2 ARP sweep via arp-scan. Output lines are IP<TAB>MAC<TAB>vendor
// framed by "Interface:", "Starting" and "Ending" banners.
class L2ScanProber : public Prober {
public:
    L2ScanProber(const CommandRunner& runner, double timeout_sec): runner_(runner), timeout_sec_(timeout_sec) {}
    std::string name() const override { return "arp-scan"; }
    ScanMethod method() const override { return ScanMethod::ScanL2; }
    bool available() const override;
    ProbeOutcome probe(const ProbeRequest& req) override;

    static std::vector<DeviceRecord> parse_output(const std::string& output);
private:
    const CommandRunner& runner_;
    double timeout_sec_;
};

}
