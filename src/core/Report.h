#pragma once
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace lan_scan {

struct SubnetScan {
    std::string cidr;
    std::vector<std::string> backends_tried; // in the order they were attempted
    std::string backend_used; // empty when every backend was exhausted
    size_t device_count = 0;
};

// Per-scan metadata layered over the device list: which subnets were swept,
// which backends produced data and which collection steps degraded.
class Report {
public:
    void set_subnet_resolved(bool v);
    void add_subnet(SubnetScan scan);
    // Warning side channel (source unavailable, tool failed, timeout).
    void add_warning(const std::string& source, const std::string& message);

    bool subnet_resolved() const { return subnet_resolved_; }
    std::vector<SubnetScan> subnets() const;
    std::vector<std::pair<std::string,std::string>> warnings() const;
private:
    bool subnet_resolved_ = false;
    std::vector<SubnetScan> subnets_;
    std::vector<std::pair<std::string,std::string>> warnings_; // (source, message)
    mutable std::mutex mutex_;
};

}
