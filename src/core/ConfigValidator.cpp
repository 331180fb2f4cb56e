#include "ConfigValidator.h"
#include "Cidr.h"
#include "Logging.h"
#include "../scanners/Prober.h"
#include <iostream>
#include <algorithm>
#include <cstdlib>

namespace lan_scan {

bool ConfigValidator::validate(Config& cfg) {
    auto method = parse_scan_method(cfg.method);
    if(!method) {
        std::cerr << "Invalid --method value: " << cfg.method << " (expected auto, scan-l2, scan-discovery or ping)\n";
        return false;
    }
    cfg.method = scan_method_to_string(*method);

    // pretty vs compact: if both set, compact wins
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }
    if(cfg.ndjson && cfg.list_subnets) {
        std::cerr << "--ndjson cannot be combined with --list-subnets\n";
        return false;
    }

    if(!validate_subnet(cfg.subnet)) return false;

    if(!validate_positive(cfg.ping_timeout, "--timeout")) return false;
    if(!validate_positive(cfg.ssdp_timeout, "--ssdp-timeout")) return false;
    if(!validate_positive(cfg.mdns_timeout, "--mdns-timeout")) return false;
    if(!validate_positive(cfg.l2_timeout, "--l2-timeout")) return false;
    if(!validate_positive(cfg.discovery_timeout, "--discovery-timeout")) return false;
    if(!validate_positive(cfg.tool_timeout, "--tool-timeout")) return false;
    if(cfg.ping_workers <= 0 || cfg.subnet_workers <= 0) {
        std::cerr << "Worker counts must be positive\n";
        return false;
    }
    if(cfg.max_prefix < 1 || cfg.max_prefix > 32) {
        std::cerr << "Invalid --max-prefix value: " << cfg.max_prefix << "\n";
        return false;
    }
    if(cfg.max_hosts < 0 || cfg.history_tail < 0) {
        std::cerr << "--max-hosts and --history-tail must not be negative\n";
        return false;
    }
    if(cfg.history_tail > 0 && cfg.history_file.empty()) {
        std::cerr << "--history-tail requires --history FILE\n";
        return false;
    }
    if(!validate_sources(cfg)) return false;

    if(!cfg.log_level.empty()) {
        LogLevel lvl;
        if(!parse_log_level(cfg.log_level, lvl)) {
            std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
            return false;
        }
    }
    return true;
}

void ConfigValidator::apply_environment(Config& cfg) {
    if(cfg.oui_file.empty()) {
        if(const char* v = std::getenv("LAN_SCAN_OUI_FILE")) cfg.oui_file = v;
    }
}

bool ConfigValidator::validate_subnet(const std::string& subnet) {
    if(subnet.empty() || subnet == "all") return true;
    if(!Ipv4Network::parse(subnet)) {
        std::cerr << "Invalid --subnet value: " << subnet << " (expected CIDR such as 192.168.1.0/24 or 'all')\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_positive(double value, const std::string& flag_name) {
    if(!(value > 0.0)) {
        std::cerr << "Invalid " << flag_name << " value: must be greater than zero\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_sources(const Config& cfg) {
    auto known = [&](const std::string& n){ return std::find(known_sources_.begin(), known_sources_.end(), n) != known_sources_.end(); };
    for(const auto& s : cfg.enable_sources) {
        if(!known(s)) { std::cerr << "Unknown enrichment source: " << s << "\n"; return false; }
        if(std::find(cfg.disable_sources.begin(), cfg.disable_sources.end(), s) != cfg.disable_sources.end()) {
            std::cerr << "Cannot enable and disable the same source: " << s << "\n";
            return false;
        }
    }
    for(const auto& s : cfg.disable_sources) {
        if(!known(s)) { std::cerr << "Unknown enrichment source: " << s << "\n"; return false; }
    }
    return true;
}

}
