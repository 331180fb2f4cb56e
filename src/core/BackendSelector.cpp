#include "BackendSelector.h"
#include "Logging.h"

namespace lan_scan {

void BackendSelector::register_prober(ProberPtr prober) {
    chain_.push_back(std::move(prober));
}

ScanMethod BackendSelector::resolve(ScanMethod requested) const {
    if(requested != ScanMethod::Auto) return requested;
    for(const auto& p : chain_) if(p->available()) return p->method();
    return chain_.empty() ? ScanMethod::Ping : chain_.back()->method();
}

SelectionResult BackendSelector::probe(const ProbeRequest& req, ScanMethod requested) {
    SelectionResult result;
    ScanMethod start = resolve(requested);
    size_t i = 0;
    while(i < chain_.size() && chain_[i]->method() != start) ++i;
    if(i == chain_.size()) i = 0;

    for(; i < chain_.size(); ++i){
        auto& prober = *chain_[i];
        result.backends_tried.push_back(prober.name());
        ProbeOutcome outcome = prober.probe(req);
        if(auto* ok = std::get_if<ProbeSuccess>(&outcome)){
            result.devices = std::move(ok->devices);
            result.backend_used = prober.name();
            return result;
        }
        if(auto* un = std::get_if<ProbeUnavailable>(&outcome)){
            Logger::instance().debug(prober.name() + " unavailable (" + un->reason + "), falling through");
        } else if(auto* failed = std::get_if<ProbeFailed>(&outcome)){
            Logger::instance().warn(prober.name() + " failed on " + req.cidr.to_string() + " (" + failed->reason + "), falling through");
        }
    }
    return result;
}

}
