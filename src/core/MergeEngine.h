#pragma once
#include "SourceRegistry.h"
#include <vector>

namespace lan_scan {

class OuiTable;

// Folds enrichment batches into the base list keyed by IP. Batches are applied
// SSDP, mDNS, DHCP leases, Wi-Fi stations regardless of the order given.
//  - known IP: fill-only (name if empty, type if "unknown", mac / vendor if absent)
//  - new IP from SSDP, mDNS or a Wi-Fi station: inserted online
//  - new IP from DHCP leases: inserted offline, and only when include_offline
// Records without a valid IPv4 address are ignored. Base order is preserved
// and new hosts are appended in the order they were seen.
std::vector<DeviceRecord> merge_enrichment(std::vector<DeviceRecord> base, const std::vector<SourceBatch>& batches, bool include_offline);

// Vendor from the OUI table for records that have a MAC but no vendor.
void fill_vendors(std::vector<DeviceRecord>& devices, const OuiTable& oui);

// Boundary normalization: Unknown status becomes Online and an empty name
// becomes the IP.
void finalize_records(std::vector<DeviceRecord>& devices);

}
