#include "SubnetResolver.h"
#include "Logging.h"
#include "Utils.h"
#include <nlohmann/json.hpp>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netinet/in.h>
#include <set>

namespace lan_scan {

using nlohmann::json;

namespace {
int prefix_from_netmask(uint32_t mask_host_order){
    int n = 0;
    while(mask_host_order & 0x80000000u){ ++n; mask_host_order <<= 1; }
    return n;
}

std::string string_field(const json& obj, const char* key){
    auto it = obj.find(key);
    if(it == obj.end() || !it->is_string()) return std::string();
    return it->get<std::string>();
}
}

std::optional<std::string> SubnetResolver::run_ip(const std::vector<std::string>& args) const {
    std::vector<std::string> argv = {"ip"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto res = runner_.run(argv, seconds_to_ms(tool_timeout_sec_));
    if(!res.ok() || utils::trim(res.out).empty()) return std::nullopt;
    return res.out;
}

std::optional<std::string> SubnetResolver::parse_default_route_dev(const std::string& text) {
    json routes = json::parse(text, nullptr, false);
    if(routes.is_discarded() || !routes.is_array() || routes.empty()) return std::nullopt;
    const auto& first = routes.front();
    if(!first.is_object() || !first.contains("dev") || !first["dev"].is_string()) return std::nullopt;
    std::string dev = first["dev"].get<std::string>();
    if(dev.empty()) return std::nullopt;
    return dev;
}

std::vector<InterfaceAddress> SubnetResolver::parse_addr_json(const std::string& text) {
    std::vector<InterfaceAddress> out;
    json ifaces = json::parse(text, nullptr, false);
    if(ifaces.is_discarded() || !ifaces.is_array()) return out;
    for(const auto& iface : ifaces){
        if(!iface.is_object()) continue;
        std::string ifname = string_field(iface, "ifname");
        auto it = iface.find("addr_info");
        if(it == iface.end() || !it->is_array()) continue;
        for(const auto& ai : *it){
            if(!ai.is_object() || string_field(ai, "family") != "inet") continue;
            if(!ai.contains("local") || !ai["local"].is_string()) continue;
            if(!ai.contains("prefixlen") || !ai["prefixlen"].is_number_integer()) continue;
            out.push_back(InterfaceAddress{ifname, ai["local"].get<std::string>(), ai["prefixlen"].get<int>()});
        }
    }
    return out;
}

std::vector<InterfaceNetwork> SubnetResolver::filter_networks(const std::vector<InterfaceAddress>& addrs, int max_prefix) {
    std::vector<InterfaceNetwork> out;
    std::set<std::string> seen;
    for(const auto& a : addrs){
        if(a.ifname.empty() || utils::starts_with(a.ifname, "lo")) continue;
        if(utils::starts_with(a.local, "127.")) continue;
        auto net = Ipv4Network::from_address(a.local, a.prefixlen);
        if(!net) continue;
        if(net->is_link_local()) continue;
        // a /8 or shorter is only plausible as private address space
        if(net->prefix() <= 8 && !net->is_private()) continue;
        // /31 and /32 are point-to-point or host-only
        if(net->prefix() > max_prefix) continue;
        std::string s = net->to_string();
        if(!seen.insert(s).second) continue;
        out.push_back(InterfaceNetwork{a.ifname, *net});
    }
    return out;
}

std::vector<InterfaceAddress> SubnetResolver::enumerate_ifaddrs() const {
    std::vector<InterfaceAddress> out;
    ifaddrs* ifa = nullptr;
    if(getifaddrs(&ifa) != 0) return out;
    for(ifaddrs* p = ifa; p; p = p->ifa_next){
        if(!p->ifa_addr || !p->ifa_netmask || p->ifa_addr->sa_family != AF_INET) continue;
        auto* sin = reinterpret_cast<sockaddr_in*>(p->ifa_addr);
        auto* mask = reinterpret_cast<sockaddr_in*>(p->ifa_netmask);
        char buf[INET_ADDRSTRLEN];
        if(!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) continue;
        out.push_back(InterfaceAddress{p->ifa_name ? p->ifa_name : "", buf, prefix_from_netmask(ntohl(mask->sin_addr.s_addr))});
    }
    freeifaddrs(ifa);
    return out;
}

std::optional<InterfaceNetwork> SubnetResolver::discover_primary() const {
    if(runner_.find_executable("ip")){
        if(auto routes = run_ip({"-j", "route", "show", "default"})){
            if(auto dev = parse_default_route_dev(*routes)){
                if(auto addrs = run_ip({"-j", "addr", "show", "dev", *dev})){
                    for(const auto& a : parse_addr_json(*addrs)){
                        if(auto net = Ipv4Network::from_address(a.local, a.prefixlen)) return InterfaceNetwork{*dev, *net};
                    }
                }
            }
        }
    }
    if(auto local = names_.local_address()){
        if(auto net = Ipv4Network::from_address(*local, 24)){
            Logger::instance().debug("primary network guessed from hostname: " + net->to_string());
            return InterfaceNetwork{"", *net};
        }
    }
    Logger::instance().debug("no primary IPv4 network determinable");
    return std::nullopt;
}

std::optional<std::string> SubnetResolver::discover_primary_cidr() const {
    auto p = discover_primary();
    if(!p) return std::nullopt;
    return p->cidr();
}

std::vector<InterfaceNetwork> SubnetResolver::discover_all(int max_prefix) const {
    std::vector<InterfaceAddress> addrs;
    if(runner_.find_executable("ip")){
        if(auto out = run_ip({"-j", "addr"})) addrs = parse_addr_json(*out);
    } else {
        addrs = enumerate_ifaddrs();
    }
    auto nets = filter_networks(addrs, max_prefix);
    if(nets.empty()){
        if(auto p = discover_primary()) nets.push_back(*p);
    }
    return nets;
}

std::vector<std::string> SubnetResolver::discover_all_cidrs(int max_prefix) const {
    std::vector<std::string> out;
    for(const auto& n : discover_all(max_prefix)) out.push_back(n.cidr());
    return out;
}

}
