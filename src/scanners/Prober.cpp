#include "Prober.h"
#include "../core/Utils.h"

namespace lan_scan {

std::optional<ScanMethod> parse_scan_method(const std::string& s){
    std::string v = utils::to_lower(utils::trim(s));
    if(v.empty() || v=="auto") return ScanMethod::Auto;
    if(v=="scan-l2" || v=="scan_l2" || v=="arp-scan") return ScanMethod::ScanL2;
    if(v=="scan-discovery" || v=="scan_discovery" || v=="nmap") return ScanMethod::ScanDiscovery;
    if(v=="ping") return ScanMethod::Ping;
    return std::nullopt;
}

const char* scan_method_to_string(ScanMethod m){
    switch(m){
        case ScanMethod::Auto: return "auto";
        case ScanMethod::ScanL2: return "scan-l2";
        case ScanMethod::ScanDiscovery: return "scan-discovery";
        case ScanMethod::Ping: return "ping";
    }
    return "auto";
}

}
