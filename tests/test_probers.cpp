#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockCommandRunner.h"
#include "../src/scanners/DiscoveryScanProber.h"
#include "../src/scanners/L2ScanProber.h"
#include "../src/scanners/PingSweepProber.h"
#include <algorithm>

namespace lan_scan {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

namespace {
ProbeRequest request(const std::string& cidr, bool include_offline = false, std::string iface = "") {
    return ProbeRequest{*Ipv4Network::parse(cidr), std::move(iface), include_offline, 0.8};
}

const char* kArpScanOutput =
    "Interface: eth0, type: EN10MB, MAC: 00:11:22:33:44:55, IPv4: 192.168.1.23\n"
    "Starting arp-scan 1.9.7 with 256 hosts (https://github.com/royhills/arp-scan)\n"
    "192.168.1.1\t50:c7:bf:aa:bb:cc\tTP-LINK TECHNOLOGIES CO.,LTD.\n"
    "192.168.1.40\tb8:27:eb:01:02:03\tRaspberry Pi Foundation\n"
    "192.168.1.77\t02:42:ac:11:00:02\t(Unknown: locally administered)\n"
    "not-an-ip\tzz\tjunk\n"
    "\n"
    "3 packets received by filter, 0 packets dropped by kernel\n"
    "Ending arp-scan 1.9.7: 256 hosts scanned in 1.9 seconds (132.70 hosts/sec). 3 responded\n";

const char* kNmapOutput =
    "Starting Nmap 7.80 ( https://nmap.org ) at 2025-01-01 10:00 UTC\n"
    "Nmap scan report for router.lan (192.168.1.1)\n"
    "Host is up (0.0010s latency).\n"
    "MAC Address: 50:C7:BF:AA:BB:CC (Tp-link Technologies)\n"
    "Nmap scan report for 192.168.1.40\n"
    "Host is up (0.0020s latency).\n"
    "MAC Address: B8:27:EB:01:02:03 (Unknown)\n"
    "Nmap scan report for desk (192.168.1.23)\n"
    "Host is up.\n"
    "Nmap done: 256 IP addresses (3 hosts up) scanned in 2.05 seconds\n";
}

TEST(L2ScanProberParseTest, ParsesTabSeparatedHosts) {
    auto devices = L2ScanProber::parse_output(kArpScanOutput);
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[0].mac.value_or(""), "50:C7:BF:AA:BB:CC");
    EXPECT_EQ(devices[0].vendor.value_or(""), "TP-LINK TECHNOLOGIES CO.,LTD.");
    EXPECT_EQ(devices[0].status, DeviceStatus::Online);
    EXPECT_EQ(devices[1].vendor.value_or(""), "Raspberry Pi Foundation");
    EXPECT_FALSE(devices[2].vendor.has_value());
}

TEST(L2ScanProberTest, UnavailableWithoutExecutable) {
    NiceMock<MockCommandRunner> runner;
    ON_CALL(runner, find_executable(_)).WillByDefault(Return(std::nullopt));
    EXPECT_CALL(runner, run(_, _)).Times(0);
    L2ScanProber prober(runner, 30);
    EXPECT_FALSE(prober.available());
    auto outcome = prober.probe(request("192.168.1.0/24"));
    EXPECT_TRUE(std::holds_alternative<ProbeUnavailable>(outcome));
}

TEST(L2ScanProberTest, PassesInterfaceAndCidr) {
    NiceMock<MockCommandRunner> runner;
    ON_CALL(runner, find_executable("arp-scan")).WillByDefault(Return(std::optional<std::string>("/usr/sbin/arp-scan")));
    EXPECT_CALL(runner, run(ElementsAre("arp-scan", "--numeric", "--timeout=200", "--interface=eth0", "192.168.1.0/24"), _))
        .WillOnce(Return(exited(0, kArpScanOutput)));
    L2ScanProber prober(runner, 30);
    auto outcome = prober.probe(request("192.168.1.0/24", false, "eth0"));
    ASSERT_TRUE(std::holds_alternative<ProbeSuccess>(outcome));
    EXPECT_EQ(std::get<ProbeSuccess>(outcome).devices.size(), 3u);
}

TEST(L2ScanProberTest, NonZeroExitOrEmptyOutputFails) {
    NiceMock<MockCommandRunner> runner;
    ON_CALL(runner, find_executable("arp-scan")).WillByDefault(Return(std::optional<std::string>("/usr/sbin/arp-scan")));
    EXPECT_CALL(runner, run(_, _))
        .WillOnce(Return(exited(1, "", "You need to be root")))
        .WillOnce(Return(exited(0, "  \n")))
        .WillOnce(Return(timed_out()));
    L2ScanProber prober(runner, 30);
    EXPECT_TRUE(std::holds_alternative<ProbeFailed>(prober.probe(request("10.0.0.0/24"))));
    EXPECT_TRUE(std::holds_alternative<ProbeFailed>(prober.probe(request("10.0.0.0/24"))));
    EXPECT_TRUE(std::holds_alternative<ProbeFailed>(prober.probe(request("10.0.0.0/24"))));
}

TEST(DiscoveryScanProberParseTest, ParsesReportBlocks) {
    auto devices = DiscoveryScanProber::parse_output(kNmapOutput);
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[0].name, "router.lan");
    EXPECT_EQ(devices[0].mac.value_or(""), "50:C7:BF:AA:BB:CC");
    EXPECT_EQ(devices[0].vendor.value_or(""), "Tp-link Technologies");
    EXPECT_EQ(devices[1].ip, "192.168.1.40");
    EXPECT_EQ(devices[1].name, "");
    EXPECT_FALSE(devices[1].vendor.has_value());
    EXPECT_EQ(devices[2].name, "desk");
    EXPECT_FALSE(devices[2].mac.has_value());
}

TEST(DiscoveryScanProberParseTest, DropsBlocksWithoutValidAddress) {
    auto devices = DiscoveryScanProber::parse_output("Nmap scan report for weird-host\nHost is up.\n");
    EXPECT_TRUE(devices.empty());
}

TEST(DiscoveryScanProberTest, RunsPingScan) {
    NiceMock<MockCommandRunner> runner;
    ON_CALL(runner, find_executable("nmap")).WillByDefault(Return(std::optional<std::string>("/usr/bin/nmap")));
    EXPECT_CALL(runner, run(ElementsAre("nmap", "-sn", "192.168.1.0/24"), _)).WillOnce(Return(exited(0, kNmapOutput)));
    DiscoveryScanProber prober(runner, 90);
    auto outcome = prober.probe(request("192.168.1.0/24"));
    ASSERT_TRUE(std::holds_alternative<ProbeSuccess>(outcome));
    EXPECT_EQ(std::get<ProbeSuccess>(outcome).devices.size(), 3u);
}

TEST(PingSweepProberCommandTest, CommandUsesWholeSeconds) {
    EXPECT_THAT(PingSweepProber::ping_command("10.0.0.1", 0.8), ElementsAre("ping", "-c", "1", "-W", "1", "10.0.0.1"));
    EXPECT_THAT(PingSweepProber::ping_command("10.0.0.1", 2.5), ElementsAre("ping", "-c", "1", "-W", "3", "10.0.0.1"));
}

class PingSweepProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(runner, find_executable("ping")).WillByDefault(Return(std::optional<std::string>("/bin/ping")));
        // .1 and .3 answer
        ON_CALL(runner, run(_, _)).WillByDefault([](const std::vector<std::string>& argv, std::chrono::milliseconds){
            const std::string& ip = argv.back();
            return (ip == "10.0.0.1" || ip == "10.0.0.3") ? exited(0) : exited(1);
        });
    }
    NiceMock<MockCommandRunner> runner;
};

TEST_F(PingSweepProberTest, OnlineOnlyByDefault) {
    PingSweepProber prober(runner, 4);
    auto outcome = prober.probe(request("10.0.0.0/29"));
    ASSERT_TRUE(std::holds_alternative<ProbeSuccess>(outcome));
    const auto& devices = std::get<ProbeSuccess>(outcome).devices;
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].ip, "10.0.0.1");
    EXPECT_EQ(devices[1].ip, "10.0.0.3");
    for(const auto& d : devices) EXPECT_EQ(d.status, DeviceStatus::Online);
}

TEST_F(PingSweepProberTest, IncludeOfflineRecordsEveryHostInOrder) {
    PingSweepProber prober(runner, 3);
    auto outcome = prober.probe(request("10.0.0.0/29", true));
    const auto& devices = std::get<ProbeSuccess>(outcome).devices;
    ASSERT_EQ(devices.size(), 6u);
    EXPECT_EQ(devices[0].ip, "10.0.0.1");
    EXPECT_EQ(devices[5].ip, "10.0.0.6");
    EXPECT_EQ(devices[1].status, DeviceStatus::Offline);
    EXPECT_EQ(devices[1].name, "10.0.0.2");
    EXPECT_EQ(devices[2].status, DeviceStatus::Online);
}

TEST_F(PingSweepProberTest, MaxHostsTruncates) {
    PingSweepProber prober(runner, 8, 2);
    auto outcome = prober.probe(request("10.0.0.0/24", true));
    EXPECT_EQ(std::get<ProbeSuccess>(outcome).devices.size(), 2u);
}

TEST_F(PingSweepProberTest, MissingPingStillSucceeds) {
    EXPECT_CALL(runner, find_executable("ping")).WillRepeatedly(Return(std::nullopt));
    EXPECT_CALL(runner, run(_, _)).Times(0);
    PingSweepProber prober(runner, 8);
    auto online = prober.probe(request("10.0.0.0/29"));
    ASSERT_TRUE(std::holds_alternative<ProbeSuccess>(online));
    EXPECT_TRUE(std::get<ProbeSuccess>(online).devices.empty());
    auto all = prober.probe(request("10.0.0.0/29", true));
    const auto& devices = std::get<ProbeSuccess>(all).devices;
    ASSERT_EQ(devices.size(), 6u);
    EXPECT_TRUE(std::all_of(devices.begin(), devices.end(), [](const DeviceRecord& d){ return d.status == DeviceStatus::Offline; }));
}

TEST(ScanMethodTest, ParseAndFormat) {
    EXPECT_EQ(parse_scan_method(""), ScanMethod::Auto);
    EXPECT_EQ(parse_scan_method("arp-scan"), ScanMethod::ScanL2);
    EXPECT_EQ(parse_scan_method("scan_l2"), ScanMethod::ScanL2);
    EXPECT_EQ(parse_scan_method("nmap"), ScanMethod::ScanDiscovery);
    EXPECT_EQ(parse_scan_method("Ping"), ScanMethod::Ping);
    EXPECT_FALSE(parse_scan_method("smoke-signals").has_value());
    EXPECT_STREQ(scan_method_to_string(ScanMethod::ScanDiscovery), "scan-discovery");
}

}
