#pragma once
#include "Prober.h"
#include "../core/CommandRunner.h"

namespace lan_scan {

// One ICMP echo per host address, at most `workers` pings in flight.
// Always succeeds: a missing ping binary just means nobody answers.
class PingSweepProber : public Prober {
public:
    PingSweepProber(const CommandRunner& runner, size_t workers, uint64_t max_hosts = 0)
        : runner_(runner), workers_(workers), max_hosts_(max_hosts) {}
    std::string name() const override { return "ping"; }
    ScanMethod method() const override { return ScanMethod::Ping; }
    bool available() const override;
    ProbeOutcome probe(const ProbeRequest& req) override;

    bool ping_once(const std::string& ip, double timeout_sec) const;
    static std::vector<std::string> ping_command(const std::string& ip, double timeout_sec);
private:
    const CommandRunner& runner_;
    size_t workers_;
    uint64_t max_hosts_;
};

}
