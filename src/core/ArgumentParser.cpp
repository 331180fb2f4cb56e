#include "ArgumentParser.h"
#include "BuildInfo.h"
#include "Utils.h"
#include <iostream>
#include <stdexcept>

namespace lan_scan {

namespace {
struct InvalidNumber : std::runtime_error {
    using std::runtime_error::runtime_error;
};

int need_int(const std::string& v, const char* flag){
    size_t used = 0; int n = 0;
    try { n = std::stoi(v, &used); } catch(const std::exception&) { throw InvalidNumber(std::string("Invalid integer for ") + flag); }
    if(used != v.size()) throw InvalidNumber(std::string("Invalid integer for ") + flag);
    return n;
}

double need_double(const std::string& v, const char* flag){
    size_t used = 0; double d = 0;
    try { d = std::stod(v, &used); } catch(const std::exception&) { throw InvalidNumber(std::string("Invalid number for ") + flag); }
    if(used != v.size()) throw InvalidNumber(std::string("Invalid number for ") + flag);
    return d;
}
}

ArgumentParser::ArgumentParser() {
    specs_ = {
        {"--subnet", ArgKind::String, "CIDR to scan, or 'all' for every interface", [](Config& c, const std::string& v){ c.subnet = v; }},
        {"--all", ArgKind::None, "Scan every local interface network", [](Config& c, const std::string&){ c.subnet = "all"; }},
        {"--method", ArgKind::String, "auto | scan-l2 | scan-discovery | ping", [](Config& c, const std::string& v){ c.method = v; }},
        {"--include-offline", ArgKind::None, "Report non-responding hosts as offline", [](Config& c, const std::string&){ c.include_offline = true; }},
        {"--deep", ArgKind::None, "Enrich with SSDP, mDNS, DHCP leases and Wi-Fi stations", [](Config& c, const std::string&){ c.deep = true; }},
        {"--no-reverse-dns", ArgKind::None, "Skip reverse DNS for online hosts", [](Config& c, const std::string&){ c.no_reverse_dns = true; }},
        {"--timeout", ArgKind::Double, "Per-host ping timeout in seconds (default 0.8)", [](Config& c, const std::string& v){ c.ping_timeout = need_double(v, "--timeout"); }},
        {"--ssdp-timeout", ArgKind::Double, "SSDP listen window in seconds", [](Config& c, const std::string& v){ c.ssdp_timeout = need_double(v, "--ssdp-timeout"); }},
        {"--mdns-timeout", ArgKind::Double, "mDNS browse window in seconds", [](Config& c, const std::string& v){ c.mdns_timeout = need_double(v, "--mdns-timeout"); }},
        {"--l2-timeout", ArgKind::Double, "Layer-2 scan timeout in seconds", [](Config& c, const std::string& v){ c.l2_timeout = need_double(v, "--l2-timeout"); }},
        {"--discovery-timeout", ArgKind::Double, "Host-discovery scan timeout in seconds", [](Config& c, const std::string& v){ c.discovery_timeout = need_double(v, "--discovery-timeout"); }},
        {"--tool-timeout", ArgKind::Double, "Timeout for ip/iw queries in seconds", [](Config& c, const std::string& v){ c.tool_timeout = need_double(v, "--tool-timeout"); }},
        {"--ping-workers", ArgKind::Int, "Concurrent ping probes (default 128)", [](Config& c, const std::string& v){ c.ping_workers = need_int(v, "--ping-workers"); }},
        {"--subnet-workers", ArgKind::Int, "Concurrent subnet scans for --all (default 8)", [](Config& c, const std::string& v){ c.subnet_workers = need_int(v, "--subnet-workers"); }},
        {"--max-prefix", ArgKind::Int, "Skip interface networks longer than this prefix", [](Config& c, const std::string& v){ c.max_prefix = need_int(v, "--max-prefix"); }},
        {"--max-hosts", ArgKind::Int, "Cap ping sweep targets per subnet", [](Config& c, const std::string& v){ c.max_hosts = need_int(v, "--max-hosts"); }},
        {"--enable-source", ArgKind::CSV, "Only run these enrichment sources", [](Config& c, const std::string& v){ c.enable_sources = utils::split_csv(v); }},
        {"--disable-source", ArgKind::CSV, "Skip these enrichment sources", [](Config& c, const std::string& v){ c.disable_sources = utils::split_csv(v); }},
        {"--dnsmasq-leases", ArgKind::String, "dnsmasq lease file", [](Config& c, const std::string& v){ c.dnsmasq_leases = v; }},
        {"--dhcpd-leases", ArgKind::String, "ISC dhcpd lease file", [](Config& c, const std::string& v){ c.dhcpd_leases = v; }},
        {"--oui-file", ArgKind::String, "MAC vendor table (JSON or ieee-oui.txt)", [](Config& c, const std::string& v){ c.oui_file = v; }},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)", [](Config& c, const std::string& v){ c.output_file = v; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON", [](Config& c, const std::string&){ c.pretty = true; }},
        {"--compact", ArgKind::None, "Minified JSON output", [](Config& c, const std::string&){ c.compact = true; }},
        {"--ndjson", ArgKind::None, "One device object per line", [](Config& c, const std::string&){ c.ndjson = true; }},
        {"--list-subnets", ArgKind::None, "Print local interface networks and exit", [](Config& c, const std::string&){ c.list_subnets = true; }},
        {"--wifi-stations", ArgKind::None, "List stations associated to local access points", [](Config& c, const std::string&){ c.wifi_stations = true; }},
        {"--history", ArgKind::String, "Append completed scans to FILE (JSON lines)", [](Config& c, const std::string& v){ c.history_file = v; }},
        {"--history-tail", ArgKind::Int, "Print last N history records and exit", [](Config& c, const std::string& v){ c.history_tail = need_int(v, "--history-tail"); }},
        {"--drop-priv", ArgKind::None, "Drop capabilities except CAP_NET_RAW/CAP_NET_ADMIN", [](Config& c, const std::string&){ c.drop_priv = true; }},
        {"--log-level", ArgKind::String, "error | warn | info | debug | trace", [](Config& c, const std::string& v){ c.log_level = v; }},
        {"--verbose", ArgKind::None, "Same as --log-level debug", [](Config& c, const std::string&){ c.log_level = "debug"; }},
        {"--quiet", ArgKind::None, "Same as --log-level error", [](Config& c, const std::string&){ c.log_level = "error"; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

void ArgumentParser::print_help() const {
    std::cout << "lan-scan options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        switch(s.kind){
            case ArgKind::String: name += " VALUE"; break;
            case ArgKind::Int: name += " N"; break;
            case ArgKind::Double: name += " SEC"; break;
            case ArgKind::CSV: name += " a,b"; break;
            case ArgKind::None: break;
        }
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i=name.size(); i<30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    for(int i=1; i<argc; ++i){
        std::string a = argv[i];
        if(a == "--help"){ print_help(); return false; }
        if(a == "--version"){
            std::cout << "lan-scan " << buildinfo::APP_VERSION << " (compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        std::string val;
        if(spec->kind != ArgKind::None){
            if(i+1 >= argc){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        try {
            spec->apply(cfg, val);
        } catch(const InvalidNumber& ex) {
            std::cerr << ex.what() << "\n";
            exit_code_ = 2;
            return false;
        }
    }
    return true;
}

}
