#pragma once
#include "Config.h"
#include <string>
#include <vector>

namespace lan_scan {

class ConfigValidator {
public:
    // Normalizes aliases and conflicting flags in place; prints the first
    // problem to stderr and returns false when the config is unusable.
    bool validate(Config& cfg);
    // Fills unset options from LAN_SCAN_* environment variables.
    void apply_environment(Config& cfg);
private:
    bool validate_subnet(const std::string& subnet);
    bool validate_positive(double value, const std::string& flag_name);
    bool validate_sources(const Config& cfg);
    const std::vector<std::string> known_sources_ = {"ssdp", "mdns", "dhcp-leases", "wifi-stations"};
};

}
