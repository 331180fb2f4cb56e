#include "L2ScanProber.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace lan_scan {

bool L2ScanProber::available() const {
    return runner_.find_executable("arp-scan").has_value();
}

ProbeOutcome L2ScanProber::probe(const ProbeRequest& req) {
    if(!available()) return ProbeUnavailable{"arp-scan not found"};
    std::vector<std::string> argv = {"arp-scan", "--numeric", "--timeout=200"};
    if(!req.interface.empty()) argv.push_back("--interface=" + req.interface);
    argv.push_back(req.cidr.to_string());
    auto res = runner_.run(argv, seconds_to_ms(timeout_sec_));
    if(!res.ok()){
        std::string why = res.timed_out ? "timed out" : "exit code " + std::to_string(res.exit_code);
        if(!utils::trim(res.err).empty()) why += ": " + utils::trim(res.err);
        return ProbeFailed{why};
    }
    if(utils::trim(res.out).empty()) return ProbeFailed{"empty output"};
    auto devices = parse_output(res.out);
    Logger::instance().debug("arp-scan " + req.cidr.to_string() + ": " + std::to_string(devices.size()) + " hosts");
    return ProbeSuccess{std::move(devices)};
}

std::vector<DeviceRecord> L2ScanProber::parse_output(const std::string& output) {
    std::vector<DeviceRecord> out;
    for(const auto& raw : utils::split(output, '\n')){
        std::string line = utils::trim(raw);
        if(line.empty()) continue;
        if(utils::starts_with(line, "Interface:") || utils::starts_with(line, "Starting") || utils::starts_with(line, "Ending")) continue;
        auto parts = utils::split(line, '\t');
        for(auto& p : parts) p = utils::trim(p);
        if(parts.size() < 2 || !is_ipv4(parts[0])) continue;
        DeviceRecord d;
        d.ip = parts[0];
        d.status = DeviceStatus::Online;
        d.mac = canonical_mac(parts[1]);
        // arp-scan prints "(Unknown)" / "(Unknown: locally administered)" for unmapped prefixes
        if(parts.size() >= 3 && !parts[2].empty() && !utils::starts_with(parts[2], "(Unknown")) d.vendor = parts[2];
        out.push_back(std::move(d));
    }
    return out;
}

}
