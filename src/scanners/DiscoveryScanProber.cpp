#include "DiscoveryScanProber.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace lan_scan {

namespace {
const char* kBlockStart = "Nmap scan report for ";
const char* kMacLine = "MAC Address:";
}

bool DiscoveryScanProber::available() const {
    return runner_.find_executable("nmap").has_value();
}

ProbeOutcome DiscoveryScanProber::probe(const ProbeRequest& req) {
    if(!available()) return ProbeUnavailable{"nmap not found"};
    auto res = runner_.run({"nmap", "-sn", req.cidr.to_string()}, seconds_to_ms(timeout_sec_));
    if(!res.ok()){
        std::string why = res.timed_out ? "timed out" : "exit code " + std::to_string(res.exit_code);
        return ProbeFailed{why};
    }
    if(utils::trim(res.out).empty()) return ProbeFailed{"empty output"};
    auto devices = parse_output(res.out);
    Logger::instance().debug("nmap " + req.cidr.to_string() + ": " + std::to_string(devices.size()) + " hosts");
    return ProbeSuccess{std::move(devices)};
}

std::vector<DeviceRecord> DiscoveryScanProber::parse_output(const std::string& output) {
    std::vector<DeviceRecord> out;
    std::optional<DeviceRecord> current;
    auto flush = [&](){
        if(current && !current->ip.empty() && is_ipv4(current->ip)) out.push_back(std::move(*current));
        current.reset();
    };

    for(const auto& raw : utils::split(output, '\n')){
        std::string line = utils::trim(raw);
        if(utils::starts_with(line, kBlockStart)){
            flush();
            current = DeviceRecord{};
            current->status = DeviceStatus::Online;
            std::string rest = line.substr(std::string(kBlockStart).size());
            auto open = rest.rfind('(');
            auto close = open == std::string::npos ? std::string::npos : rest.find(')', open);
            if(open != std::string::npos && close != std::string::npos){
                current->ip = utils::trim(rest.substr(open + 1, close - open - 1));
                current->name = utils::trim(rest.substr(0, open));
            } else {
                auto toks = utils::split_ws(rest);
                if(!toks.empty()) current->ip = toks.back();
            }
        } else if(current && utils::starts_with(line, kMacLine)){
            std::string rest = utils::trim(line.substr(std::string(kMacLine).size()));
            auto toks = utils::split_ws(rest);
            if(!toks.empty()) current->mac = canonical_mac(toks[0]);
            auto open = rest.find('(');
            auto close = rest.rfind(')');
            if(open != std::string::npos && close != std::string::npos && close > open){
                std::string vendor = rest.substr(open + 1, close - open - 1);
                if(!vendor.empty() && vendor != "Unknown") current->vendor = vendor;
            }
        }
    }
    flush();
    return out;
}

}
