#pragma once
#include <string>
#include <optional>

namespace lan_scan {

// Unknown only appears on partial records coming out of probers/sources; the
// engine coerces it to Online before results leave the boundary.
enum class DeviceStatus { Online, Offline, Unknown };

const char* status_to_string(DeviceStatus s);
DeviceStatus status_from_string(const std::string& s);

// One host, keyed by IPv4 address. Partial records (from a single source)
// may leave name empty; normalized records never do.
struct DeviceRecord {
    std::string ip;
    std::string name;
    DeviceStatus status = DeviceStatus::Unknown;
    std::string type = "unknown"; // unknown, ssdp, mdns, wifi-station
    std::optional<std::string> mac; // always canonical AA:BB:CC:DD:EE:FF when set
    std::optional<std::string> vendor;
};

// Uppercase, hyphens to colons, surrounding whitespace stripped. Idempotent.
std::string normalize_mac(const std::string& mac);
bool is_canonical_mac(const std::string& mac);
// normalize_mac + shape check; nullopt for anything that is not six octets.
std::optional<std::string> canonical_mac(const std::string& mac);
// First three octets ("AA:BB:CC") of a canonical MAC.
std::string mac_prefix(const std::string& canonical);

}
