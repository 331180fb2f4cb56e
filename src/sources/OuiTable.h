#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lan_scan {

// MAC prefix -> vendor. The table is loaded on first lookup from the first
// readable file in the search path and is read-only afterwards, so lookups
// from concurrent workers need no further locking.
class OuiTable {
public:
    explicit OuiTable(std::vector<std::string> search_path);
    explicit OuiTable(std::map<std::string, std::string> entries);

    // nullopt for malformed MACs and unknown prefixes.
    std::optional<std::string> vendor_for(const std::string& mac) const;
    size_t size() const;
    const std::string& source() const; // file the table came from; empty if none

    // Default search path: explicit file, $LAN_SCAN_OUI_FILE, installed JSON, arp-scan's table.
    static std::vector<std::string> default_search_path(const std::string& configured);
    // JSON object {"AA:BB:CC": "Vendor"} or ieee-oui.txt ("AABBCC<TAB>Vendor").
    static std::optional<std::map<std::string, std::string>> load_file(const std::string& path);
    static std::map<std::string, std::string> parse_json(const std::string& content);
    static std::map<std::string, std::string> parse_ieee_txt(const std::string& content);
private:
    void ensure_loaded() const;
    std::vector<std::string> search_path_;
    mutable std::once_flag once_;
    mutable std::map<std::string, std::string> entries_;
    mutable std::string source_;
};

}
