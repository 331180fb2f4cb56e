#pragma once
#include "Prober.h"
#include "../core/CommandRunner.h"

namespace lan_scan {

// Active host discovery via `nmap -sn`. Each host is a block opened by
// "Nmap scan report for [name (]ip[)]" and optionally followed by a
// "MAC Address: mac (vendor)" line.
class DiscoveryScanProber : public Prober {
public:
    DiscoveryScanProber(const CommandRunner& runner, double timeout_sec): runner_(runner), timeout_sec_(timeout_sec) {}
    std::string name() const override { return "nmap"; }
    ScanMethod method() const override { return ScanMethod::ScanDiscovery; }
    bool available() const override;
    ProbeOutcome probe(const ProbeRequest& req) override;

    static std::vector<DeviceRecord> parse_output(const std::string& output);
private:
    const CommandRunner& runner_;
    double timeout_sec_;
};

}
