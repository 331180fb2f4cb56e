#include "JSONWriter.h"
#include "BuildInfo.h"
#include "Utils.h"
#include <chrono>
#include <cstdlib>

namespace lan_scan {

using nlohmann::json;

json device_to_json(const DeviceRecord& d){
    json j;
    j["name"] = d.name;
    j["ip"] = d.ip;
    j["status"] = status_to_string(d.status);
    j["type"] = d.type;
    j["mac"] = d.mac ? json(*d.mac) : json(nullptr);
    j["vendor"] = d.vendor ? json(*d.vendor) : json(nullptr);
    return j;
}

json devices_to_json(const std::vector<DeviceRecord>& devices){
    json arr = json::array();
    for(const auto& d : devices) arr.push_back(device_to_json(d));
    return arr;
}

DeviceRecord device_from_json(const json& j){
    DeviceRecord d;
    if(!j.is_object()) return d;
    auto str = [&](const char* key) -> std::optional<std::string> {
        auto it = j.find(key);
        if(it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };
    d.ip = str("ip").value_or("");
    d.name = str("name").value_or("");
    if(auto s = str("status")) d.status = status_from_string(*s);
    if(auto t = str("type")) d.type = *t;
    d.mac = str("mac");
    d.vendor = str("vendor");
    return d;
}

std::string JSONWriter::dump(const json& j, const Config& cfg){
    bool pretty = cfg.pretty && !cfg.compact;
    return j.dump(pretty ? 2 : -1);
}

std::string JSONWriter::write(const std::vector<DeviceRecord>& devices, const Report& report, const Config& cfg) const {
    if(cfg.ndjson){
        std::string out;
        for(const auto& d : devices) out += device_to_json(d).dump() + "\n";
        return out;
    }
    auto subnets = report.subnets();
    std::string backend;
    json subnet_arr = json::array();
    for(const auto& s : subnets){
        if(backend.empty()) backend = s.backend_used;
        subnet_arr.push_back({
            {"cidr", s.cidr},
            {"backends_tried", s.backends_tried},
            {"backend_used", s.backend_used.empty() ? json(nullptr) : json(s.backend_used)},
            {"device_count", s.device_count}
        });
    }
    json meta;
    meta["tool_version"] = buildinfo::APP_VERSION;
    if(const char* t = std::getenv("LAN_SCAN_META_TIME_ZERO"); t && *t) meta["timestamp"] = "";
    else meta["timestamp"] = utils::time_to_iso(std::chrono::system_clock::now());
    meta["subnet"] = cfg.subnet.empty() ? json(nullptr) : json(cfg.subnet);
    meta["method"] = cfg.method;
    meta["backend_used"] = backend.empty() ? json(nullptr) : json(backend);
    meta["include_offline"] = cfg.include_offline;
    meta["deep"] = cfg.deep;
    meta["subnet_resolved"] = report.subnet_resolved();
    meta["device_count"] = devices.size();

    json warnings = json::array();
    for(const auto& w : report.warnings()) warnings.push_back({{"source", w.first}, {"message", w.second}});

    json root;
    root["meta"] = std::move(meta);
    root["subnets"] = std::move(subnet_arr);
    root["devices"] = devices_to_json(devices);
    root["warnings"] = std::move(warnings);
    return dump(root, cfg) + "\n";
}

std::string JSONWriter::write_subnets(const std::vector<std::string>& cidrs, const Config& cfg) const {
    json root;
    root["subnets"] = cidrs;
    root["supports_all"] = true;
    return dump(root, cfg) + "\n";
}

std::string JSONWriter::write_devices(const std::vector<DeviceRecord>& devices, const Config& cfg) const {
    if(cfg.ndjson){
        std::string out;
        for(const auto& d : devices) out += device_to_json(d).dump() + "\n";
        return out;
    }
    return dump(devices_to_json(devices), cfg) + "\n";
}

}
