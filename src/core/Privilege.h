// Linux capability helpers (best-effort; compile-time gated on libcap)
#pragma once
namespace lan_scan {
// Clears every capability except CAP_NET_RAW and CAP_NET_ADMIN.
void drop_capabilities();
// CAP_NET_RAW in the effective set; euid == 0 when libcap is unavailable.
bool has_net_raw();
bool is_privilege_available();
}
