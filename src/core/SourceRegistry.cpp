#include "SourceRegistry.h"
#include "Config.h"
#include "Logging.h"
#include "Report.h"
#include "WorkerPool.h"
#include <algorithm>

namespace lan_scan {

void SourceRegistry::register_source(EnrichmentSourcePtr source) {
    sources_.push_back(std::move(source));
}

bool SourceRegistry::is_enabled(const std::string& name) const {
    auto& cfg = config();
    if(!cfg.enable_sources.empty()) {
        bool found = std::find(cfg.enable_sources.begin(), cfg.enable_sources.end(), name)!=cfg.enable_sources.end();
        if(!found) return false;
    }
    if(!cfg.disable_sources.empty()) {
        if(std::find(cfg.disable_sources.begin(), cfg.disable_sources.end(), name)!=cfg.disable_sources.end()) return false;
    }
    return true;
}

std::vector<SourceBatch> SourceRegistry::run_all(Report& report) {
    std::vector<EnrichmentSource*> active;
    for(auto& s : sources_) if(is_enabled(s->name())) active.push_back(s.get());

    std::vector<SourceBatch> batches(active.size());
    parallel_for(active.size(), active.size(), [&](size_t i){
        auto* s = active[i];
        batches[i].source = s->name();
        batches[i].kind = s->kind();
        Logger::instance().debug("Starting source: " + s->name() + " (" + s->description() + ")");
        try {
            batches[i].records = s->collect();
        } catch(const std::exception& ex) {
            batches[i].records.clear();
            report.add_warning(s->name(), ex.what());
            Logger::instance().warn("source " + s->name() + " failed: " + ex.what());
        }
        Logger::instance().debug("Finished source: " + s->name() + " (" + std::to_string(batches[i].records.size()) + " records)");
    });
    return batches;
}

std::vector<std::string> SourceRegistry::names() const {
    std::vector<std::string> out;
    for(const auto& s : sources_) out.push_back(s->name());
    return out;
}

}
