#pragma once
#include "../sources/EnrichmentSource.h"
#include <string>
#include <vector>

namespace lan_scan {

class Report;

// One source's contribution to a deep scan.
struct SourceBatch {
    std::string source;
    SourceKind kind = SourceKind::Ssdp;
    std::vector<DeviceRecord> records;
};

class SourceRegistry {
public:
    void register_source(EnrichmentSourcePtr source);
    // Sources selected by config().enable_sources / disable_sources.
    bool is_enabled(const std::string& name) const;
    // Runs every enabled source concurrently. A source that throws contributes
    // an empty batch and a warning; batches come back in registration order.
    std::vector<SourceBatch> run_all(Report& report);
    std::vector<std::string> names() const;
    size_t size() const { return sources_.size(); }
private:
    std::vector<EnrichmentSourcePtr> sources_;
};

}
