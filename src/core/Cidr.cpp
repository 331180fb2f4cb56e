#include "Cidr.h"
#include "Utils.h"
#include <cctype>

namespace lan_scan {

std::optional<uint32_t> parse_ipv4(const std::string& s){
    auto parts = utils::split(s, '.');
    if(parts.size() != 4) return std::nullopt;
    uint32_t out = 0;
    for(const auto& p : parts){
        if(p.empty() || p.size() > 3) return std::nullopt;
        if(p.size() > 1 && p[0]=='0') return std::nullopt;
        unsigned v = 0;
        for(char c : p){ if(!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt; v = v*10 + static_cast<unsigned>(c-'0'); }
        if(v > 255) return std::nullopt;
        out = (out << 8) | v;
    }
    return out;
}

std::string format_ipv4(uint32_t a){
    return std::to_string((a>>24)&0xFF) + "." + std::to_string((a>>16)&0xFF) + "." + std::to_string((a>>8)&0xFF) + "." + std::to_string(a&0xFF);
}

bool is_ipv4(const std::string& s){ return parse_ipv4(s).has_value(); }

static uint32_t prefix_mask(int prefix){
    if(prefix <= 0) return 0;
    return prefix >= 32 ? 0xFFFFFFFFu : (0xFFFFFFFFu << (32 - prefix));
}

std::optional<Ipv4Network> Ipv4Network::parse(const std::string& cidr){
    auto slash = cidr.find('/');
    if(slash == std::string::npos) return std::nullopt;
    std::string plen = cidr.substr(slash+1);
    if(plen.empty() || plen.size() > 2) return std::nullopt;
    for(char c : plen) if(!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    return from_address(cidr.substr(0, slash), std::stoi(plen));
}

std::optional<Ipv4Network> Ipv4Network::from_address(const std::string& ip, int prefix){
    if(prefix < 0 || prefix > 32) return std::nullopt;
    auto addr = parse_ipv4(ip);
    if(!addr) return std::nullopt;
    return Ipv4Network(*addr & prefix_mask(prefix), prefix);
}

uint32_t Ipv4Network::mask() const { return prefix_mask(prefix_); }
uint32_t Ipv4Network::broadcast() const { return network_ | ~mask(); }

uint64_t Ipv4Network::host_count() const {
    uint64_t total = uint64_t(1) << (32 - prefix_);
    if(prefix_ >= 31) return total;
    return total - 2;
}

std::vector<std::string> Ipv4Network::hosts(uint64_t limit) const {
    std::vector<std::string> out;
    uint64_t first = network_, last = broadcast();
    if(prefix_ < 31){ ++first; --last; }
    uint64_t n = last >= first ? last - first + 1 : 0;
    if(limit > 0 && n > limit) n = limit;
    out.reserve(static_cast<size_t>(n));
    for(uint64_t i = 0; i < n; ++i) out.push_back(format_ipv4(static_cast<uint32_t>(first + i)));
    return out;
}

bool Ipv4Network::contains(uint32_t addr) const { return (addr & mask()) == network_; }

bool Ipv4Network::within(const Ipv4Network& outer) const {
    return prefix_ >= outer.prefix_ && outer.contains(network_);
}

bool Ipv4Network::is_private() const {
    static const Ipv4Network ranges[] = {
        Ipv4Network(0x0A000000u, 8), Ipv4Network(0xAC100000u, 12), Ipv4Network(0xC0A80000u, 16)
    };
    for(const auto& r : ranges) if(within(r)) return true;
    return false;
}

bool Ipv4Network::is_link_local() const { return within(Ipv4Network(0xA9FE0000u, 16)); }
bool Ipv4Network::is_loopback() const { return within(Ipv4Network(0x7F000000u, 8)); }

std::string Ipv4Network::to_string() const {
    return format_ipv4(network_) + "/" + std::to_string(prefix_);
}

}
