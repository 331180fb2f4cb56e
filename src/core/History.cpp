#include "History.h"
#include "JSONWriter.h"
#include "Logging.h"
#include "ScanEngine.h"
#include "Utils.h"
#include <openssl/rand.h>
#include <chrono>
#include <cstdio>
#include <deque>
#include <fstream>
#include <iterator>

namespace lan_scan {

using nlohmann::json;

std::string ScanHistory::make_uuid(){
    unsigned char b[16];
    if(RAND_bytes(b, sizeof(b)) != 1) throw HistoryError("RAND_bytes failed");
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
    char out[37];
    std::snprintf(out, sizeof(out), "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
        b[0],b[1],b[2],b[3],b[4],b[5],b[6],b[7],b[8],b[9],b[10],b[11],b[12],b[13],b[14],b[15]);
    return out;
}

json ScanHistory::to_json(const HistoryEntry& e){
    json j;
    j["id"] = e.id;
    j["ts"] = e.ts;
    j["params"] = e.params;
    j["result"] = devices_to_json(e.result);
    return j;
}

std::optional<HistoryEntry> ScanHistory::from_json_line(const std::string& line){
    auto j = json::parse(line, nullptr, false);
    if(j.is_discarded() || !j.is_object()) return std::nullopt;
    auto id = j.find("id");
    if(id == j.end() || !id->is_string()) return std::nullopt;
    HistoryEntry e;
    e.id = id->get<std::string>();
    auto ts = j.find("ts");
    if(ts != j.end() && ts->is_string()) e.ts = ts->get<std::string>();
    auto params = j.find("params");
    e.params = (params != j.end() && params->is_object()) ? *params : json::object();
    auto result = j.find("result");
    if(result != j.end() && result->is_array())
        for(const auto& d : *result) e.result.push_back(device_from_json(d));
    return e;
}

HistoryEntry ScanHistory::append(const ScanRequest& req, const std::vector<DeviceRecord>& devices) const {
    HistoryEntry e;
    e.id = make_uuid();
    e.ts = utils::time_to_iso(std::chrono::system_clock::now());
    e.params = {
        {"subnet", req.subnet.empty() ? json(nullptr) : json(req.subnet)},
        {"method", scan_method_to_string(req.method)},
        {"include_offline", req.include_offline},
        {"deep", req.deep}
    };
    e.result = devices;
    std::ofstream out(path_, std::ios::app);
    if(!out) throw HistoryError("cannot open history file " + path_);
    out << to_json(e).dump() << '\n';
    if(!out) throw HistoryError("write to history file " + path_ + " failed");
    Logger::instance().debug("history: appended " + e.id + " to " + path_);
    return e;
}

std::vector<HistoryEntry> ScanHistory::tail(size_t limit) const {
    std::deque<HistoryEntry> window;
    if(limit == 0) return {};
    for(const auto& line : utils::read_lines(path_)){
        if(utils::trim(line).empty()) continue;
        auto e = from_json_line(line);
        if(!e){ Logger::instance().debug("history: skipping malformed line in " + path_); continue; }
        window.push_back(std::move(*e));
        if(window.size() > limit) window.pop_front();
    }
    return {std::make_move_iterator(window.begin()), std::make_move_iterator(window.end())};
}

}
