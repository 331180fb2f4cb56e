#include "PingSweepProber.h"
#include "../core/Logging.h"
#include "../core/WorkerPool.h"
#include <algorithm>
#include <cmath>

namespace lan_scan {

bool PingSweepProber::available() const {
    return runner_.find_executable("ping").has_value();
}

std::vector<std::string> PingSweepProber::ping_command(const std::string& ip, double timeout_sec) {
    // iputils only takes whole seconds for -W on older releases
    long wait = std::max(1L, static_cast<long>(std::ceil(timeout_sec)));
    return {"ping", "-c", "1", "-W", std::to_string(wait), ip};
}

bool PingSweepProber::ping_once(const std::string& ip, double timeout_sec) const {
    auto limit = std::max(std::chrono::milliseconds(1000), seconds_to_ms(timeout_sec * 2));
    return runner_.run(ping_command(ip, timeout_sec), limit).ok();
}

ProbeOutcome PingSweepProber::probe(const ProbeRequest& req) {
    auto hosts = req.cidr.hosts(max_hosts_);
    if(max_hosts_ > 0 && req.cidr.host_count() > max_hosts_){
        Logger::instance().warn("ping sweep of " + req.cidr.to_string() + " truncated at " + std::to_string(max_hosts_) + " hosts");
    }
    bool have_ping = available();
    if(!have_ping) Logger::instance().warn("ping not found; every host in " + req.cidr.to_string() + " will be unreachable");

    std::vector<char> alive(hosts.size(), 0);
    if(have_ping){
        parallel_for(hosts.size(), workers_, [&](size_t i){
            alive[i] = ping_once(hosts[i], req.timeout_per_host) ? 1 : 0;
        });
    }

    std::vector<DeviceRecord> devices;
    for(size_t i=0; i<hosts.size(); ++i){
        if(!alive[i] && !req.include_offline) continue;
        DeviceRecord d;
        d.ip = hosts[i];
        d.status = alive[i] ? DeviceStatus::Online : DeviceStatus::Offline;
        if(!alive[i]) d.name = hosts[i]; // online hosts get reverse DNS later
        devices.push_back(std::move(d));
    }
    Logger::instance().debug("ping " + req.cidr.to_string() + ": " + std::to_string(devices.size()) + " records");
    return ProbeSuccess{std::move(devices)};
}

}
