#include "Privilege.h"
#include "Logging.h"
#include <string>
#include <unistd.h>
#ifdef LAN_SCAN_HAVE_LIBCAP
#include <sys/capability.h>
#endif

namespace lan_scan {

namespace {
void log_capabilities(const std::string& context) {
#ifdef LAN_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if (!caps) {
        Logger::instance().warn("Failed to get current capabilities for " + context);
        return;
    }
    char* cap_text = cap_to_text(caps, nullptr);
    if (cap_text) {
        Logger::instance().debug("Capabilities " + context + ": " + std::string(cap_text));
        cap_free(cap_text);
    }
    cap_free(caps);
#else
    (void)context;
#endif
}
}

void drop_capabilities(){
#ifdef LAN_SCAN_HAVE_LIBCAP
    Logger::instance().info("Dropping capabilities (keeping CAP_NET_RAW, CAP_NET_ADMIN)");
    log_capabilities("before drop");
    cap_t current = cap_get_proc();
    if(!current){ Logger::instance().warn("cap_get_proc failed; capabilities unchanged"); return; }
    cap_t caps = cap_init();
    if(!caps){ cap_free(current); Logger::instance().warn("cap_init failed; capabilities unchanged"); return; }
    const cap_value_t keep[] = { CAP_NET_RAW, CAP_NET_ADMIN };
    for(cap_value_t v : keep){
        cap_flag_value_t permitted = CAP_CLEAR;
        // Only keep what we already hold; raising a capability would fail cap_set_proc.
        if(cap_get_flag(current, v, CAP_PERMITTED, &permitted)!=0 || permitted!=CAP_SET) continue;
        cap_set_flag(caps, CAP_PERMITTED, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_EFFECTIVE, 1, &v, CAP_SET);
        cap_set_flag(caps, CAP_INHERITABLE, 1, &v, CAP_SET);
    }
    if(cap_set_proc(caps)!=0){
        Logger::instance().error("cap_set_proc failed");
    } else {
        log_capabilities("after drop");
    }
    cap_free(caps);
    cap_free(current);
#else
    Logger::instance().info("Capability dropping not available (libcap not compiled in)");
#endif
}

bool has_net_raw(){
#ifdef LAN_SCAN_HAVE_LIBCAP
    cap_t caps = cap_get_proc();
    if(!caps) return geteuid()==0;
    cap_flag_value_t v = CAP_CLEAR;
    bool ok = cap_get_flag(caps, CAP_NET_RAW, CAP_EFFECTIVE, &v)==0 && v==CAP_SET;
    cap_free(caps);
    return ok;
#else
    return geteuid()==0;
#endif
}

bool is_privilege_available(){
#ifdef LAN_SCAN_HAVE_LIBCAP
    return true;
#else
    return false;
#endif
}

}
