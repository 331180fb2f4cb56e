#pragma once
#include "Cidr.h"
#include "CommandRunner.h"
#include "NameResolver.h"
#include <optional>
#include <string>
#include <vector>

namespace lan_scan {

struct InterfaceAddress {
    std::string ifname;
    std::string local;
    int prefixlen = 0;
};

struct InterfaceNetwork {
    std::string ifname; // empty when derived from the hostname fallback
    Ipv4Network network;
    std::string cidr() const { return network.to_string(); }
};

// Works out which IPv4 networks are local. Never throws: "nothing found"
// comes back as nullopt / an empty list.
class SubnetResolver {
public:
    SubnetResolver(const CommandRunner& runner, const NameResolver& names, double tool_timeout_sec = 10.0)
        : runner_(runner), names_(names), tool_timeout_sec_(tool_timeout_sec) {}
    virtual ~SubnetResolver() = default;

    // Default-route interface's first IPv4 network, else hostname address as /24.
    std::optional<InterfaceNetwork> discover_primary() const;
    std::optional<std::string> discover_primary_cidr() const;

    // Every sweepable non-loopback interface network, de-duplicated in
    // discovery order. Falls back to the primary network when empty.
    std::vector<InterfaceNetwork> discover_all(int max_prefix = 30) const;
    std::vector<std::string> discover_all_cidrs(int max_prefix = 30) const;

    static std::optional<std::string> parse_default_route_dev(const std::string& json);
    static std::vector<InterfaceAddress> parse_addr_json(const std::string& json);
    static std::vector<InterfaceNetwork> filter_networks(const std::vector<InterfaceAddress>& addrs, int max_prefix);

protected:
    // getifaddrs(3) enumeration, used when `ip` is unavailable.
    virtual std::vector<InterfaceAddress> enumerate_ifaddrs() const;

private:
    std::optional<std::string> run_ip(const std::vector<std::string>& args) const;
    const CommandRunner& runner_;
    const NameResolver& names_;
    double tool_timeout_sec_;
};

}
