#include "Report.h"

namespace lan_scan {

void Report::set_subnet_resolved(bool v) {
    std::lock_guard<std::mutex> lock(mutex_);
    subnet_resolved_ = v;
}

void Report::add_subnet(SubnetScan scan) {
    std::lock_guard<std::mutex> lock(mutex_);
    subnets_.push_back(std::move(scan));
}

void Report::add_warning(const std::string& source, const std::string& message){
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.emplace_back(source, message);
}

std::vector<SubnetScan> Report::subnets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subnets_;
}

std::vector<std::pair<std::string,std::string>> Report::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

}
