#include "OuiTable.h"
#include "../core/Device.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <utility>

#ifndef LAN_SCAN_DATADIR
#define LAN_SCAN_DATADIR "/usr/local/share"
#endif

namespace lan_scan {

namespace {
// "aa-bb-cc", "AA:BB:CC" and "AABBCC" all become "AA:BB:CC".
std::optional<std::string> normalize_prefix(const std::string& raw){
    std::string hex;
    for(char c : normalize_mac(raw)){
        if(c == ':') continue;
        if(!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
        hex.push_back(c);
    }
    if(hex.size() != 6) return std::nullopt;
    return hex.substr(0,2) + ":" + hex.substr(2,2) + ":" + hex.substr(4,2);
}
}

OuiTable::OuiTable(std::vector<std::string> search_path): search_path_(std::move(search_path)) {}

OuiTable::OuiTable(std::map<std::string, std::string> entries) {
    std::call_once(once_, [&]{
        for(auto& kv : entries) if(auto p = normalize_prefix(kv.first)) entries_[*p] = kv.second;
    });
}

std::vector<std::string> OuiTable::default_search_path(const std::string& configured) {
    std::vector<std::string> out;
    if(!configured.empty()) out.push_back(configured);
    if(const char* env = std::getenv("LAN_SCAN_OUI_FILE")) if(*env) out.push_back(env);
    out.push_back(std::string(LAN_SCAN_DATADIR) + "/lan-scan/oui_prefixes.json");
    out.push_back("/usr/share/arp-scan/ieee-oui.txt");
    return out;
}

std::map<std::string, std::string> OuiTable::parse_json(const std::string& content) {
    std::map<std::string, std::string> out;
    auto j = nlohmann::json::parse(content, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return out;
    for(auto it = j.begin(); it != j.end(); ++it){
        if(!it.value().is_string()) continue;
        if(auto p = normalize_prefix(it.key())) out[*p] = it.value().get<std::string>();
    }
    return out;
}

std::map<std::string, std::string> OuiTable::parse_ieee_txt(const std::string& content) {
    std::map<std::string, std::string> out;
    for(const auto& raw : utils::split(content, '\n')){
        std::string line = utils::trim(raw);
        if(line.empty() || line[0] == '#') continue;
        auto tab = line.find('\t');
        if(tab == std::string::npos) continue;
        auto p = normalize_prefix(line.substr(0, tab));
        std::string vendor = utils::trim(line.substr(tab + 1));
        if(p && !vendor.empty()) out[*p] = vendor;
    }
    return out;
}

std::optional<std::map<std::string, std::string>> OuiTable::load_file(const std::string& path) {
    auto content = utils::read_file(path);
    if(!content) return std::nullopt;
    std::string head = utils::trim(content->substr(0, 64));
    if(!head.empty() && head[0] == '{') return parse_json(*content);
    return parse_ieee_txt(*content);
}

void OuiTable::ensure_loaded() const {
    std::call_once(once_, [this]{
        for(const auto& path : search_path_){
            if(auto loaded = load_file(path)){
                entries_ = std::move(*loaded);
                source_ = path;
                Logger::instance().debug("OUI table: " + std::to_string(entries_.size()) + " prefixes from " + path);
                return;
            }
        }
        Logger::instance().debug("OUI table: no vendor file found; vendors limited to what scanners report");
    });
}

std::optional<std::string> OuiTable::vendor_for(const std::string& mac) const {
    auto canon = canonical_mac(mac);
    if(!canon) return std::nullopt;
    ensure_loaded();
    auto it = entries_.find(mac_prefix(*canon));
    if(it == entries_.end()) return std::nullopt;
    return it->second;
}

size_t OuiTable::size() const { ensure_loaded(); return entries_.size(); }
const std::string& OuiTable::source() const { ensure_loaded(); return source_; }

}
