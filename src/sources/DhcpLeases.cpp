#include "DhcpLeases.h"
#include "../core/Cidr.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <map>
#include <regex>

namespace lan_scan {

std::vector<DeviceRecord> DhcpLeaseSource::parse_dnsmasq(const std::string& content) {
    std::vector<DeviceRecord> out;
    for(const auto& line : utils::split(content, '\n')){
        auto parts = utils::split_ws(line);
        if(parts.size() < 4 || !is_ipv4(parts[2])) continue;
        DeviceRecord d;
        d.ip = parts[2];
        d.mac = canonical_mac(parts[1]);
        if(parts[3] != "*") d.name = parts[3];
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<DeviceRecord> DhcpLeaseSource::parse_dhcpd(const std::string& content) {
    static const std::regex block_re(R"(lease\s+(\d+\.\d+\.\d+\.\d+)\s*\{([^}]*)\})");
    static const std::regex mac_re(R"(hardware\s+ethernet\s+([0-9a-fA-F:]+);)", std::regex::icase);
    static const std::regex name_re(R"re(client-hostname\s+"([^"]+)";)re", std::regex::icase);

    std::vector<DeviceRecord> out;
    std::map<std::string, size_t> index;
    for(std::sregex_iterator it(content.begin(), content.end(), block_re), end; it != end; ++it){
        std::string ip = (*it)[1].str();
        if(!is_ipv4(ip)) continue;
        std::string body = (*it)[2].str();
        DeviceRecord d;
        d.ip = ip;
        std::smatch m;
        if(std::regex_search(body, m, mac_re)) d.mac = canonical_mac(m[1].str());
        if(std::regex_search(body, m, name_re)) d.name = m[1].str();
        auto found = index.find(ip);
        if(found != index.end()) out[found->second] = std::move(d);
        else { index[ip] = out.size(); out.push_back(std::move(d)); }
    }
    return out;
}

std::vector<DeviceRecord> DhcpLeaseSource::parse_dnsmasq_file(const std::string& path) {
    auto content = utils::read_file(path);
    if(!content) return {};
    return parse_dnsmasq(*content);
}

std::vector<DeviceRecord> DhcpLeaseSource::parse_dhcpd_file(const std::string& path) {
    auto content = utils::read_file(path);
    if(!content) return {};
    return parse_dhcpd(*content);
}

std::vector<DeviceRecord> DhcpLeaseSource::collect() {
    auto leases = parse_dnsmasq_file(dnsmasq_path_);
    auto isc = parse_dhcpd_file(dhcpd_path_);
    leases.insert(leases.end(), std::make_move_iterator(isc.begin()), std::make_move_iterator(isc.end()));
    Logger::instance().debug("dhcp leases: " + std::to_string(leases.size()) + " entries");
    return leases;
}

}
