#include "NeighborTable.h"
#include "../core/Cidr.h"
#include "../core/Device.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace lan_scan {

std::map<std::string, std::string> NeighborTable::read() const {
    if(runner_.find_executable("ip")){
        auto res = runner_.run({"ip", "-4", "neigh", "show"}, seconds_to_ms(timeout_sec_));
        if(res.ok()) return parse_ip_neigh(res.out);
        Logger::instance().debug("ip neigh show failed; trying " + proc_path_);
    }
    auto content = utils::read_file(proc_path_);
    if(!content){
        Logger::instance().debug("neighbor table unreadable: " + proc_path_);
        return {};
    }
    return parse_proc_arp(*content);
}

// 192.168.1.10 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE
// 192.168.1.11 dev eth0 FAILED
std::map<std::string, std::string> NeighborTable::parse_ip_neigh(const std::string& output) {
    std::map<std::string, std::string> out;
    for(const auto& line : utils::split(output, '\n')){
        auto parts = utils::split_ws(line);
        if(parts.size() < 5 || parts[1] != "dev" || !is_ipv4(parts[0])) continue;
        for(size_t i=2; i+1<parts.size(); ++i){
            if(parts[i] != "lladdr") continue;
            if(auto mac = canonical_mac(parts[i+1])) out[parts[0]] = *mac;
            break;
        }
    }
    return out;
}

// IP address  HW type  Flags  HW address  Mask  Device
// 192.168.1.1 0x1      0x2    aa:bb:...   *     eth0
std::map<std::string, std::string> NeighborTable::parse_proc_arp(const std::string& content) {
    std::map<std::string, std::string> out;
    bool header = true;
    for(const auto& line : utils::split(content, '\n')){
        if(header){ header = false; continue; }
        auto parts = utils::split_ws(line);
        if(parts.size() < 4 || !is_ipv4(parts[0])) continue;
        if(parts[2] == "0x0") continue; // incomplete
        auto mac = canonical_mac(parts[3]);
        if(!mac || *mac == "00:00:00:00:00:00") continue;
        out[parts[0]] = *mac;
    }
    return out;
}

}
