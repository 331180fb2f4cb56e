#pragma once
#include "../scanners/Prober.h"
#include <string>
#include <vector>

namespace lan_scan {

struct SelectionResult {
    std::vector<DeviceRecord> devices;
    std::vector<std::string> backends_tried;
    std::string backend_used; // empty when every backend came up empty-handed
};

// Owns the probers in priority order (layer-2, active discovery, ping) and
// walks that chain from the requested backend, stopping at the first
// ProbeSuccess.
class BackendSelector {
public:
    void register_prober(ProberPtr prober);
    // Auto -> first registered prober whose executable is present, else the last one.
    ScanMethod resolve(ScanMethod requested) const;
    SelectionResult probe(const ProbeRequest& req, ScanMethod requested);
    size_t size() const { return chain_.size(); }
private:
    std::vector<ProberPtr> chain_;
};

}
