#include "MergeEngine.h"
#include "Cidr.h"
#include "../sources/OuiTable.h"
#include <algorithm>
#include <unordered_map>

namespace lan_scan {

namespace {
int merge_rank(SourceKind k){
    switch(k){
        case SourceKind::Ssdp: return 0;
        case SourceKind::Mdns: return 1;
        case SourceKind::DhcpLeases: return 2;
        case SourceKind::WifiStations: return 3;
    }
    return 4;
}

void fill_missing(DeviceRecord& into, const DeviceRecord& from){
    if(into.name.empty() && !from.name.empty()) into.name = from.name;
    if(into.type == "unknown" && !from.type.empty() && from.type != "unknown") into.type = from.type;
    if(!into.mac && from.mac) into.mac = from.mac;
    if(!into.vendor && from.vendor) into.vendor = from.vendor;
}
}

std::vector<DeviceRecord> merge_enrichment(std::vector<DeviceRecord> base, const std::vector<SourceBatch>& batches, bool include_offline) {
    std::vector<const SourceBatch*> ordered;
    for(const auto& b : batches) ordered.push_back(&b);
    std::stable_sort(ordered.begin(), ordered.end(), [](const SourceBatch* a, const SourceBatch* b){
        return merge_rank(a->kind) < merge_rank(b->kind);
    });

    std::unordered_map<std::string, size_t> index;
    for(size_t i=0;i<base.size();++i) index.emplace(base[i].ip, i);

    for(const auto* batch : ordered){
        for(const auto& rec : batch->records){
            if(!is_ipv4(rec.ip)) continue;
            auto it = index.find(rec.ip);
            if(it != index.end()){ fill_missing(base[it->second], rec); continue; }
            DeviceRecord added = rec;
            if(batch->kind == SourceKind::DhcpLeases){
                if(!include_offline) continue;
                added.status = DeviceStatus::Offline;
            } else {
                added.status = DeviceStatus::Online;
            }
            index.emplace(added.ip, base.size());
            base.push_back(std::move(added));
        }
    }
    return base;
}

void fill_vendors(std::vector<DeviceRecord>& devices, const OuiTable& oui) {
    for(auto& d : devices){
        if(!d.mac || d.vendor) continue;
        if(auto v = oui.vendor_for(*d.mac)) d.vendor = *v;
    }
}

void finalize_records(std::vector<DeviceRecord>& devices) {
    for(auto& d : devices){
        if(d.status == DeviceStatus::Unknown) d.status = DeviceStatus::Online;
        if(d.name.empty()) d.name = d.ip;
    }
}

}
