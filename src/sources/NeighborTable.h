#pragma once
#include "../core/CommandRunner.h"
#include <map>
#include <string>
#include <utility>

namespace lan_scan {

// Kernel IPv4 neighbor (ARP) cache as ip -> canonical MAC. Only entries with
// a resolved link-layer address are returned.
class NeighborTable {
public:
    explicit NeighborTable(const CommandRunner& runner, double timeout_sec = 10.0, std::string proc_path = "/proc/net/arp")
        : runner_(runner), timeout_sec_(timeout_sec), proc_path_(std::move(proc_path)) {}
    virtual ~NeighborTable() = default;

    // `ip neigh show`, or /proc/net/arp when `ip` is missing. Empty on failure.
    virtual std::map<std::string, std::string> read() const;

    static std::map<std::string, std::string> parse_ip_neigh(const std::string& output);
    static std::map<std::string, std::string> parse_proc_arp(const std::string& content);
private:
    const CommandRunner& runner_;
    double timeout_sec_;
    std::string proc_path_;
};

}
