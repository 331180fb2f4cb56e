#include "WifiStations.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <map>

namespace lan_scan {

std::vector<WirelessInterface> WifiStationSource::parse_iw_dev(const std::string& output) {
    std::vector<WirelessInterface> out;
    for(const auto& raw : utils::split(output, '\n')){
        auto parts = utils::split_ws(raw);
        if(parts.size() < 2) continue;
        if(parts[0] == "Interface") out.push_back({parts[1], ""});
        else if(parts[0] == "type" && !out.empty()) out.back().type = utils::to_lower(parts[1]);
    }
    return out;
}

std::vector<std::string> WifiStationSource::parse_station_dump(const std::string& output) {
    std::vector<std::string> macs;
    for(const auto& raw : utils::split(output, '\n')){
        auto parts = utils::split_ws(raw);
        if(parts.size() < 2 || utils::to_lower(parts[0]) != "station") continue;
        if(auto mac = canonical_mac(parts[1])) macs.push_back(*mac);
    }
    return macs;
}

std::vector<DeviceRecord> WifiStationSource::discover() {
    std::vector<DeviceRecord> out;
    if(!runner_.find_executable("iw")) { Logger::instance().debug("wifi-stations: iw not found"); return out; }
    auto timeout = seconds_to_ms(timeout_sec_);
    auto dev = runner_.run({"iw", "dev"}, timeout);
    if(!dev.ok() || dev.out.empty()) return out;
    auto ifaces = parse_iw_dev(dev.out);

    std::map<std::string, std::string> mac_to_ip, mac_to_name;
    for(const auto& kv : neighbors_.read()) mac_to_ip[kv.second] = kv.first;
    for(const auto& lease : leases_.collect()){
        if(!lease.mac || lease.ip.empty()) continue;
        mac_to_ip[*lease.mac] = lease.ip;
        if(!lease.name.empty()) mac_to_name[*lease.mac] = lease.name;
    }

    for(const auto& iface : ifaces){
        if(iface.type != "ap") continue;
        auto dump = runner_.run({"iw", "dev", iface.ifname, "station", "dump"}, timeout);
        if(!dump.ok()) { Logger::instance().warn("wifi-stations: station dump failed on " + iface.ifname); continue; }
        for(const auto& mac : parse_station_dump(dump.out)){
            DeviceRecord r;
            r.mac = mac;
            auto ip = mac_to_ip.find(mac);
            if(ip != mac_to_ip.end()) r.ip = ip->second;
            auto nm = mac_to_name.find(mac);
            r.name = nm != mac_to_name.end() ? nm->second : (!r.ip.empty() ? r.ip : mac);
            r.status = DeviceStatus::Online;
            r.type = "wifi-station";
            out.push_back(std::move(r));
        }
    }
    return out;
}

}
