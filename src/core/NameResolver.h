#pragma once
#include <optional>
#include <string>

namespace lan_scan {

class NameResolver {
public:
    virtual ~NameResolver() = default;
    // PTR lookup; nullopt when the address has no name.
    virtual std::optional<std::string> reverse_lookup(const std::string& ip) const = 0;
    // IPv4 address the local hostname resolves to, unless it is loopback.
    virtual std::optional<std::string> local_address() const = 0;
};

// getnameinfo / gethostname + getaddrinfo. Bounded by the system resolver's
// own timeout settings (resolv.conf).
class SystemNameResolver : public NameResolver {
public:
    std::optional<std::string> reverse_lookup(const std::string& ip) const override;
    std::optional<std::string> local_address() const override;
};

}
