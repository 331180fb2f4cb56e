#pragma once
#include "BackendSelector.h"
#include "CommandRunner.h"
#include "Config.h"
#include "NameResolver.h"
#include "Report.h"
#include "SourceRegistry.h"
#include "SubnetResolver.h"
#include "../sources/DhcpLeases.h"
#include "../sources/NeighborTable.h"
#include "../sources/OuiTable.h"
#include <string>
#include <vector>

namespace lan_scan {

struct ScanRequest {
    std::string subnet; // empty = primary network, "all" = every local network, else a CIDR
    ScanMethod method = ScanMethod::Auto;
    bool include_offline = false;
    double timeout_per_host = 0.8;
    bool deep = false;
};

ScanRequest make_scan_request(const Config& cfg);

// The discovery engine: subnet resolution, backend selection per subnet,
// normalization and (for deep scans) enrichment. scan() never throws for
// discovery problems; its worst case is an empty list with the reason in the Report.
class ScanEngine {
public:
    // register_defaults=false leaves the prober chain and the source registry
    // empty so callers can install their own.
    ScanEngine(const CommandRunner& runner, const NameResolver& names, Config cfg, bool register_defaults = true);

    std::vector<DeviceRecord> scan(const ScanRequest& req, Report& report);

    std::optional<std::string> discover_primary_cidr() const { return resolver_.discover_primary_cidr(); }
    std::vector<std::string> list_subnets() const { return resolver_.discover_all_cidrs(cfg_.max_prefix); }
    std::vector<DeviceRecord> discover_wifi_stations();

    BackendSelector& selector() { return selector_; }
    SourceRegistry& sources() { return sources_; }
    const OuiTable& oui() const { return oui_; }

private:
    void register_default_probers();
    void register_default_sources();
    std::vector<InterfaceNetwork> resolve_targets(const std::string& subnet) const;
    std::vector<DeviceRecord> scan_subnet(const InterfaceNetwork& target, const ScanRequest& req, SubnetScan& summary);
    void fill_from_neighbors(std::vector<DeviceRecord>& devices) const;
    void resolve_names(std::vector<DeviceRecord>& devices) const;

    const CommandRunner& runner_;
    const NameResolver& names_;
    Config cfg_;
    SubnetResolver resolver_;
    BackendSelector selector_;
    SourceRegistry sources_;
    NeighborTable neighbors_;
    DhcpLeaseSource wifi_leases_;
    OuiTable oui_;
};

}
