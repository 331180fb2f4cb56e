#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <optional>

namespace lan_scan {

// Strict dotted-quad parsing: four decimal octets, no leading zeros.
std::optional<uint32_t> parse_ipv4(const std::string& s);
std::string format_ipv4(uint32_t addr);
bool is_ipv4(const std::string& s);

class Ipv4Network {
public:
    // "a.b.c.d/n"; host bits are zeroed (non-strict, like the kernel reports them).
    static std::optional<Ipv4Network> parse(const std::string& cidr);
    static std::optional<Ipv4Network> from_address(const std::string& ip, int prefix);

    uint32_t network() const { return network_; }
    int prefix() const { return prefix_; }
    uint32_t mask() const;
    uint32_t broadcast() const;

    // Usable host addresses: network and broadcast are excluded for /0-/30,
    // /31 yields both addresses and /32 the single address.
    uint64_t host_count() const;
    std::vector<std::string> hosts(uint64_t limit = 0) const;

    bool contains(uint32_t addr) const;
    bool within(const Ipv4Network& outer) const;
    bool is_private() const;    // entirely inside 10/8, 172.16/12 or 192.168/16
    bool is_link_local() const; // inside 169.254/16
    bool is_loopback() const;   // inside 127/8

    std::string to_string() const;
    bool operator==(const Ipv4Network& o) const { return network_==o.network_ && prefix_==o.prefix_; }

private:
    Ipv4Network(uint32_t net, int prefix): network_(net), prefix_(prefix) {}
    uint32_t network_ = 0;
    int prefix_ = 0;
};

}
