#pragma once
#include "EnrichmentSource.h"
#include "NeighborTable.h"
#include "DhcpLeases.h"
#include "../core/CommandRunner.h"
#include <string>
#include <vector>

namespace lan_scan {

struct WirelessInterface { std::string ifname; std::string type; };

// Stations associated with local access-point interfaces (`iw dev X station dump`).
// IPs come from the neighbor table and DHCP leases (leases win); a station
// with neither keeps an empty ip and is only useful for listing.
class WifiStationSource : public EnrichmentSource {
public:
    WifiStationSource(const CommandRunner& runner, const NeighborTable& neighbors, DhcpLeaseSource& leases, double timeout_sec = 5.0)
        : runner_(runner), neighbors_(neighbors), leases_(leases), timeout_sec_(timeout_sec) {}
    std::string name() const override { return "wifi-stations"; }
    std::string description() const override { return "Clients associated with local Wi-Fi access points"; }
    SourceKind kind() const override { return SourceKind::WifiStations; }
    std::vector<DeviceRecord> collect() override { return discover(); }

    std::vector<DeviceRecord> discover();

    static std::vector<WirelessInterface> parse_iw_dev(const std::string& output);
    static std::vector<std::string> parse_station_dump(const std::string& output);
private:
    const CommandRunner& runner_;
    const NeighborTable& neighbors_;
    DhcpLeaseSource& leases_;
    double timeout_sec_;
};

}
