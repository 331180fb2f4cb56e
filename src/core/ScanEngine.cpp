#include "ScanEngine.h"
#include "Logging.h"
#include "MergeEngine.h"
#include "Privilege.h"
#include "WorkerPool.h"
#include "../scanners/DiscoveryScanProber.h"
#include "../scanners/L2ScanProber.h"
#include "../scanners/PingSweepProber.h"
#include "../sources/MdnsBrowser.h"
#include "../sources/SsdpDiscovery.h"
#include "../sources/WifiStations.h"
#include <algorithm>
#include <unordered_set>

namespace lan_scan {

ScanRequest make_scan_request(const Config& cfg) {
    ScanRequest req;
    req.subnet = cfg.subnet;
    req.method = parse_scan_method(cfg.method).value_or(ScanMethod::Auto);
    req.include_offline = cfg.include_offline;
    req.timeout_per_host = cfg.ping_timeout;
    req.deep = cfg.deep;
    return req;
}

ScanEngine::ScanEngine(const CommandRunner& runner, const NameResolver& names, Config cfg, bool register_defaults)
    : runner_(runner), names_(names), cfg_(std::move(cfg)),
      resolver_(runner, names, cfg_.tool_timeout),
      neighbors_(runner, cfg_.tool_timeout),
      wifi_leases_(cfg_.dnsmasq_leases, cfg_.dhcpd_leases),
      oui_(OuiTable::default_search_path(cfg_.oui_file)) {
    if(register_defaults){
        register_default_probers();
        register_default_sources();
    }
}

void ScanEngine::register_default_probers() {
    selector_.register_prober(std::make_unique<L2ScanProber>(runner_, cfg_.l2_timeout));
    selector_.register_prober(std::make_unique<DiscoveryScanProber>(runner_, cfg_.discovery_timeout));
    selector_.register_prober(std::make_unique<PingSweepProber>(runner_, static_cast<size_t>(cfg_.ping_workers), static_cast<uint64_t>(cfg_.max_hosts)));
}

void ScanEngine::register_default_sources() {
    sources_.register_source(std::make_unique<SsdpSource>(cfg_.ssdp_timeout));
    sources_.register_source(std::make_unique<MdnsSource>(make_mdns_browser(runner_), cfg_.mdns_timeout));
    sources_.register_source(std::make_unique<DhcpLeaseSource>(cfg_.dnsmasq_leases, cfg_.dhcpd_leases));
    sources_.register_source(std::make_unique<WifiStationSource>(runner_, neighbors_, wifi_leases_, cfg_.tool_timeout));
}

std::vector<InterfaceNetwork> ScanEngine::resolve_targets(const std::string& subnet) const {
    if(subnet.empty()){
        if(auto primary = resolver_.discover_primary()) return {*primary};
        return {};
    }
    if(subnet == "all") return resolver_.discover_all(cfg_.max_prefix);
    auto net = Ipv4Network::parse(subnet);
    if(!net) return {};
    return {InterfaceNetwork{"", *net}};
}

std::vector<DeviceRecord> ScanEngine::scan_subnet(const InterfaceNetwork& target, const ScanRequest& req, SubnetScan& summary) {
    ProbeRequest probe{target.network, target.ifname, req.include_offline, req.timeout_per_host};
    Logger::instance().info("Scanning " + target.cidr() + (target.ifname.empty() ? "" : " on " + target.ifname));
    auto selected = selector_.probe(probe, req.method);

    std::vector<DeviceRecord> out;
    std::unordered_set<std::string> seen;
    for(auto& d : selected.devices){
        if(!is_ipv4(d.ip)) continue;
        if(!req.include_offline && d.status == DeviceStatus::Offline) continue;
        if(!seen.insert(d.ip).second) continue;
        out.push_back(std::move(d));
    }
    summary.cidr = target.cidr();
    summary.backends_tried = std::move(selected.backends_tried);
    summary.backend_used = std::move(selected.backend_used);
    summary.device_count = out.size();
    return out;
}

void ScanEngine::fill_from_neighbors(std::vector<DeviceRecord>& devices) const {
    bool missing = std::any_of(devices.begin(), devices.end(), [](const DeviceRecord& d){ return !d.mac; });
    if(!missing) return;
    auto table = neighbors_.read();
    for(auto& d : devices){
        if(d.mac) continue;
        auto it = table.find(d.ip);
        if(it != table.end()) d.mac = it->second;
    }
}

void ScanEngine::resolve_names(std::vector<DeviceRecord>& devices) const {
    // Every scanned host leaves here named, so enrichment never renames it.
    std::vector<size_t> pending;
    for(size_t i=0;i<devices.size();++i){
        auto& d = devices[i];
        if(!d.name.empty()) continue;
        if(cfg_.no_reverse_dns || d.status == DeviceStatus::Offline) d.name = d.ip;
        else pending.push_back(i);
    }
    parallel_for(pending.size(), static_cast<size_t>(cfg_.ping_workers), [&](size_t k){
        auto& d = devices[pending[k]];
        d.name = names_.reverse_lookup(d.ip).value_or(d.ip);
    });
}

std::vector<DeviceRecord> ScanEngine::scan(const ScanRequest& req, Report& report) {
    auto targets = resolve_targets(req.subnet);
    if(targets.empty()){
        report.set_subnet_resolved(false);
        report.add_warning("resolver", req.subnet.empty() ? "no local IPv4 network could be determined" : "cannot resolve subnet '" + req.subnet + "'");
        Logger::instance().warn("No subnet to scan");
        return {};
    }
    report.set_subnet_resolved(true);
    if(selector_.resolve(req.method) == ScanMethod::ScanL2 && !has_net_raw())
        Logger::instance().warn("arp-scan needs CAP_NET_RAW; expect it to fail and fall through");

    std::vector<std::vector<DeviceRecord>> per_subnet(targets.size());
    std::vector<SubnetScan> summaries(targets.size());
    size_t workers = std::min(static_cast<size_t>(std::max(1, cfg_.subnet_workers)), targets.size());
    parallel_for(targets.size(), workers, [&](size_t i){
        per_subnet[i] = scan_subnet(targets[i], req, summaries[i]);
    });

    // Subnet order, first writer wins for addresses seen on overlapping networks.
    std::vector<DeviceRecord> devices;
    std::unordered_set<std::string> seen;
    for(size_t i=0;i<targets.size();++i){
        if(summaries[i].cidr.empty()) summaries[i].cidr = targets[i].cidr();
        report.add_subnet(summaries[i]);
        for(auto& d : per_subnet[i]) if(seen.insert(d.ip).second) devices.push_back(std::move(d));
    }

    fill_from_neighbors(devices);
    resolve_names(devices);
    if(req.deep){
        auto batches = sources_.run_all(report);
        devices = merge_enrichment(std::move(devices), batches, req.include_offline);
    }
    fill_vendors(devices, oui_);
    finalize_records(devices);
    Logger::instance().info("Scan complete: " + std::to_string(devices.size()) + " devices");
    return devices;
}

std::vector<DeviceRecord> ScanEngine::discover_wifi_stations() {
    WifiStationSource source(runner_, neighbors_, wifi_leases_, cfg_.tool_timeout);
    auto stations = source.discover();
    fill_vendors(stations, oui_);
    return stations;
}

}
