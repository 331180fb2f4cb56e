#pragma once
#include "EnrichmentSource.h"
#include <map>
#include <string>
#include <vector>

namespace lan_scan {

// UPnP SSDP M-SEARCH against 239.255.255.250:1900. Replies are collected
// until the listen window closes and de-duplicated by sender address.
class SsdpSource : public EnrichmentSource {
public:
    explicit SsdpSource(double timeout_sec = 2.0): timeout_sec_(timeout_sec) {}
    std::string name() const override { return "ssdp"; }
    std::string description() const override { return "UPnP devices answering an SSDP multicast search"; }
    SourceKind kind() const override { return SourceKind::Ssdp; }
    std::vector<DeviceRecord> collect() override;

    static const char* search_request();
    // Header names uppercased; the status line is stored under "_status".
    static std::map<std::string, std::string> parse_response(const std::string& packet);
    // SERVER, then ST, then USN, then the sender address.
    static std::string display_name(const std::map<std::string, std::string>& headers, const std::string& ip);

    // Folds one reply into the result, replacing an earlier reply from the same address.
    static void add_reply(std::vector<DeviceRecord>& devices, const std::string& ip, const std::string& packet);
private:
    double timeout_sec_;
};

}
