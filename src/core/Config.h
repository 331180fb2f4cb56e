#pragma once
#include <string>
#include <vector>
#include <optional>

namespace lan_scan {

struct Config {
    // Scan request
    std::string subnet; // empty = primary interface network, "all" = every interface
    std::string method = "auto"; // auto | scan-l2 | scan-discovery | ping (aliases normalized by ConfigValidator)
    bool include_offline = false;
    bool deep = false; // SSDP / mDNS / DHCP lease / Wi-Fi station enrichment
    bool no_reverse_dns = false;

    // Timeouts (seconds)
    double ping_timeout = 0.8; // per host
    double ssdp_timeout = 2.0;
    double mdns_timeout = 3.0;
    double l2_timeout = 30.0; // arp-scan run
    double discovery_timeout = 90.0; // nmap -sn run
    double tool_timeout = 10.0; // ip / iw / neighbor table queries

    // Concurrency and size limits
    int ping_workers = 128;
    int subnet_workers = 8;
    int max_prefix = 30; // longer prefixes are point-to-point / host routes
    int max_hosts = 0; // 0 = unlimited, otherwise cap on ping sweep targets per subnet

    // Enrichment sources (names as reported by EnrichmentSource::name())
    std::vector<std::string> enable_sources; // if non-empty, only these
    std::vector<std::string> disable_sources;
    std::string dnsmasq_leases = "/var/lib/misc/dnsmasq.leases";
    std::string dhcpd_leases = "/var/lib/dhcp/dhcpd.leases";
    std::string oui_file; // empty = built-in search path

    // Output
    std::string output_file;
    bool pretty = false;
    bool compact = false; // wins over pretty
    bool ndjson = false;

    // Modes
    bool list_subnets = false;
    bool wifi_stations = false;
    std::string history_file; // append completed scans as JSON lines
    int history_tail = 0; // >0: print last N history records and exit

    std::string log_level; // empty = info
    bool drop_priv = false; // keep only CAP_NET_RAW / CAP_NET_ADMIN
};

Config& config();
void set_config(const Config& c);

}
