#include "MdnsBrowser.h"
#include "../core/Cidr.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <cctype>

namespace lan_scan {

std::unique_ptr<MdnsBrowser> make_mdns_browser(const CommandRunner& runner) {
    if(auto exe = runner.find_executable("avahi-browse")){
        Logger::instance().debug("mDNS browsing via " + *exe);
        return std::make_unique<AvahiMdnsBrowser>(runner, *exe);
    }
    Logger::instance().debug("avahi-browse not found; mDNS discovery disabled");
    return std::make_unique<NullMdnsBrowser>();
}

std::string AvahiMdnsBrowser::unescape(const std::string& s) {
    std::string out; out.reserve(s.size());
    for(size_t i=0; i<s.size(); ++i){
        if(s[i] != '\\' || i+1 >= s.size()){ out.push_back(s[i]); continue; }
        if(i+3 < s.size() && std::isdigit(static_cast<unsigned char>(s[i+1])) && std::isdigit(static_cast<unsigned char>(s[i+2])) && std::isdigit(static_cast<unsigned char>(s[i+3]))){
            int v = (s[i+1]-'0')*100 + (s[i+2]-'0')*10 + (s[i+3]-'0');
            if(v < 256){ out.push_back(static_cast<char>(v)); i += 3; continue; }
        }
        out.push_back(s[i+1]);
        ++i;
    }
    return out;
}

std::vector<DeviceRecord> AvahiMdnsBrowser::parse_output(const std::string& output) {
    std::vector<DeviceRecord> out;
    for(const auto& line : utils::split(output, '\n')){
        if(line.empty() || line[0] != '=') continue;
        auto f = utils::split(line, ';');
        if(f.size() < 9 || f[2] != "IPv4") continue;
        const std::string& ip = f[7];
        if(!is_ipv4(ip)) continue;
        DeviceRecord d;
        d.ip = ip;
        d.name = unescape(f[3]);
        if(d.name.empty()) d.name = ip;
        d.status = DeviceStatus::Online;
        d.type = "mdns";
        bool replaced = false;
        for(auto& existing : out){ if(existing.ip == ip){ existing = d; replaced = true; break; } }
        if(!replaced) out.push_back(std::move(d));
    }
    return out;
}

std::vector<DeviceRecord> AvahiMdnsBrowser::browse(double timeout_sec) {
    auto res = runner_.run({executable_, "--parsable", "--resolve", "--terminate", "--no-db-lookup", "_http._tcp"}, seconds_to_ms(timeout_sec));
    if(!res.launched) return {};
    // A timeout still leaves whatever was resolved inside the window.
    if(!res.timed_out && res.exit_code != 0){
        Logger::instance().debug("avahi-browse exited with " + std::to_string(res.exit_code) + ": " + utils::trim(res.err));
        return {};
    }
    auto devices = parse_output(res.out);
    Logger::instance().debug("mdns: " + std::to_string(devices.size()) + " hosts");
    return devices;
}

}
