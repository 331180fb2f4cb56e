#pragma once
#include "Device.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lan_scan {

struct ScanRequest;

struct HistoryEntry {
    std::string id;
    std::string ts;
    nlohmann::json params; // {subnet, method, include_offline, deep}
    std::vector<DeviceRecord> result;
};

class HistoryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Append-only JSON-lines log of completed scans.
class ScanHistory {
public:
    explicit ScanHistory(std::string path): path_(std::move(path)) {}

    // Throws HistoryError when the file cannot be written or no random id can be drawn.
    HistoryEntry append(const ScanRequest& req, const std::vector<DeviceRecord>& devices) const;
    // Last `limit` records, oldest first. Malformed lines are skipped; a missing file is empty.
    std::vector<HistoryEntry> tail(size_t limit = 10) const;

    const std::string& path() const { return path_; }

    static nlohmann::json to_json(const HistoryEntry& e);
    static std::optional<HistoryEntry> from_json_line(const std::string& line);
    // Random version-4 UUID (RFC 4122 layout) from OpenSSL's CSPRNG.
    static std::string make_uuid();
private:
    std::string path_;
};

}
