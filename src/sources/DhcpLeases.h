#pragma once
#include "EnrichmentSource.h"
#include <string>
#include <utility>
#include <vector>

namespace lan_scan {

// Lease-derived records carry ip, mac (canonical) and the client hostname.
class DhcpLeaseSource : public EnrichmentSource {
public:
    DhcpLeaseSource(std::string dnsmasq_path, std::string dhcpd_path)
        : dnsmasq_path_(std::move(dnsmasq_path)), dhcpd_path_(std::move(dhcpd_path)) {}
    std::string name() const override { return "dhcp-leases"; }
    std::string description() const override { return "Client names and MACs from local DHCP server lease files"; }
    SourceKind kind() const override { return SourceKind::DhcpLeases; }
    std::vector<DeviceRecord> collect() override;

    // dnsmasq: "<expiry> <mac> <ip> <hostname|*> <client-id>" per line.
    static std::vector<DeviceRecord> parse_dnsmasq(const std::string& content);
    // ISC dhcpd: "lease <ip> { ... hardware ethernet <mac>; client-hostname "<name>"; }".
    // A later block for the same address replaces the earlier one.
    static std::vector<DeviceRecord> parse_dhcpd(const std::string& content);

    static std::vector<DeviceRecord> parse_dnsmasq_file(const std::string& path);
    static std::vector<DeviceRecord> parse_dhcpd_file(const std::string& path);
private:
    std::string dnsmasq_path_;
    std::string dhcpd_path_;
};

}
