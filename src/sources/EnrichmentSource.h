#pragma once
#include "../core/Device.h"
#include <memory>
#include <string>
#include <vector>

namespace lan_scan {

// Merge order and insertion rules depend on the kind, not on the name.
enum class SourceKind { Ssdp, Mdns, DhcpLeases, WifiStations };

// A best-effort producer of partial device records. collect() may throw;
// SourceRegistry turns that into an empty contribution plus a warning.
class EnrichmentSource {
public:
    virtual ~EnrichmentSource() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual SourceKind kind() const = 0;
    virtual std::vector<DeviceRecord> collect() = 0;
};

using EnrichmentSourcePtr = std::unique_ptr<EnrichmentSource>;

}
