#include "Device.h"
#include "Utils.h"
#include <cctype>

namespace lan_scan {

const char* status_to_string(DeviceStatus s){
    switch(s){
        case DeviceStatus::Online: return "online";
        case DeviceStatus::Offline: return "offline";
        case DeviceStatus::Unknown: return "unknown";
    }
    return "unknown";
}

DeviceStatus status_from_string(const std::string& s){
    if(s=="online") return DeviceStatus::Online;
    if(s=="offline") return DeviceStatus::Offline;
    return DeviceStatus::Unknown;
}

std::string normalize_mac(const std::string& mac){
    std::string out = utils::to_upper(utils::trim(mac));
    for(auto& c : out) if(c=='-') c = ':';
    return out;
}

bool is_canonical_mac(const std::string& mac){
    if(mac.size() != 17) return false;
    for(size_t i=0;i<mac.size();++i){
        char c = mac[i];
        if(i % 3 == 2){ if(c != ':') return false; continue; }
        if(!std::isxdigit(static_cast<unsigned char>(c)) || std::islower(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::optional<std::string> canonical_mac(const std::string& mac){
    std::string n = normalize_mac(mac);
    if(!is_canonical_mac(n)) return std::nullopt;
    return n;
}

std::string mac_prefix(const std::string& canonical){
    return canonical.substr(0, 8);
}

}
