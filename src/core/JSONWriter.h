#pragma once
#include "Config.h"
#include "Device.h"
#include "Report.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace lan_scan {

// {"name","ip","status","type","mac","vendor"}; absent mac / vendor are null.
nlohmann::json device_to_json(const DeviceRecord& d);
nlohmann::json devices_to_json(const std::vector<DeviceRecord>& devices);
// Inverse of device_to_json, for history records. Missing fields keep their defaults.
DeviceRecord device_from_json(const nlohmann::json& j);

class JSONWriter {
public:
    // {"meta","subnets","devices","warnings"}, or one device per line with cfg.ndjson.
    std::string write(const std::vector<DeviceRecord>& devices, const Report& report, const Config& cfg) const;
    std::string write_subnets(const std::vector<std::string>& cidrs, const Config& cfg) const;
    std::string write_devices(const std::vector<DeviceRecord>& devices, const Config& cfg) const;
private:
    static std::string dump(const nlohmann::json& j, const Config& cfg);
};

}
