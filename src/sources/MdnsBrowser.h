#pragma once
#include "EnrichmentSource.h"
#include "../core/CommandRunner.h"
#include <memory>
#include <string>
#include <vector>

namespace lan_scan {

// Browses for _http._tcp services for a bounded window.
class MdnsBrowser {
public:
    virtual ~MdnsBrowser() = default;
    virtual bool available() const = 0;
    virtual std::vector<DeviceRecord> browse(double timeout_sec) = 0;
};

// Hosts without any mDNS capability get this: same interface, no results.
class NullMdnsBrowser : public MdnsBrowser {
public:
    bool available() const override { return false; }
    std::vector<DeviceRecord> browse(double) override { return {}; }
};

// Drives avahi-browse in parsable, resolve, terminate mode.
class AvahiMdnsBrowser : public MdnsBrowser {
public:
    AvahiMdnsBrowser(const CommandRunner& runner, std::string executable)
        : runner_(runner), executable_(std::move(executable)) {}
    bool available() const override { return true; }
    std::vector<DeviceRecord> browse(double timeout_sec) override;

    // Resolved lines: =;iface;IPv4;name;type;domain;host;address;port;txt
    static std::vector<DeviceRecord> parse_output(const std::string& output);
    // avahi escapes '.' and '\' with a backslash and other bytes as \DDD (decimal).
    static std::string unescape(const std::string& s);
private:
    const CommandRunner& runner_;
    std::string executable_;
};

// Probes for the capability once, at construction time.
std::unique_ptr<MdnsBrowser> make_mdns_browser(const CommandRunner& runner);

class MdnsSource : public EnrichmentSource {
public:
    MdnsSource(std::unique_ptr<MdnsBrowser> browser, double timeout_sec = 3.0)
        : browser_(std::move(browser)), timeout_sec_(timeout_sec) {}
    std::string name() const override { return "mdns"; }
    std::string description() const override { return "Hosts advertising HTTP services over mDNS/DNS-SD"; }
    SourceKind kind() const override { return SourceKind::Mdns; }
    std::vector<DeviceRecord> collect() override { return browser_->browse(timeout_sec_); }
private:
    std::unique_ptr<MdnsBrowser> browser_;
    double timeout_sec_;
};

}
