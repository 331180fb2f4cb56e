#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockCommandRunner.h"
#include "TempDir.h"
#include "../src/sources/WifiStations.h"

namespace lan_scan {

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;

namespace {
const char* kIwDev =
    "phy#1\n"
    "\tInterface wlan1\n"
    "\t\tifindex 5\n"
    "\t\taddr 02:00:00:00:01:00\n"
    "\t\ttype AP\n"
    "phy#0\n"
    "\tInterface wlan0\n"
    "\t\tifindex 3\n"
    "\t\ttype managed\n";

const char* kStationDump =
    "Station aa:bb:cc:00:00:01 (on wlan1)\n"
    "\tinactive time:\t300 ms\n"
    "\trx bytes:\t1234\n"
    "Station aa:bb:cc:00:00:02 (on wlan1)\n"
    "\tinactive time:\t10 ms\n"
    "Station aa:bb:cc:00:00:03 (on wlan1)\n"
    "Station not-a-mac (on wlan1)\n";

// Neighbor table double returning a fixed map.
class FixedNeighborTable : public NeighborTable {
public:
    FixedNeighborTable(const CommandRunner& r, std::map<std::string, std::string> t): NeighborTable(r), table_(std::move(t)) {}
    std::map<std::string, std::string> read() const override { return table_; }
private:
    std::map<std::string, std::string> table_;
};
}

TEST(WifiStationParseTest, IwDevInterfacesAndTypes) {
    auto ifaces = WifiStationSource::parse_iw_dev(kIwDev);
    ASSERT_EQ(ifaces.size(), 2u);
    EXPECT_EQ(ifaces[0].ifname, "wlan1");
    EXPECT_EQ(ifaces[0].type, "ap");
    EXPECT_EQ(ifaces[1].ifname, "wlan0");
    EXPECT_EQ(ifaces[1].type, "managed");
}

TEST(WifiStationParseTest, StationDumpMacs) {
    auto macs = WifiStationSource::parse_station_dump(kStationDump);
    EXPECT_THAT(macs, ElementsAre("AA:BB:CC:00:00:01", "AA:BB:CC:00:00:02", "AA:BB:CC:00:00:03"));
}

class WifiStationSourceTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        ON_CALL(runner, find_executable("iw")).WillByDefault(Return(std::optional<std::string>("/usr/sbin/iw")));
    }
    NiceMock<MockCommandRunner> runner;
};

TEST_F(WifiStationSourceTest, CrossReferencesNeighborsAndLeases) {
    EXPECT_CALL(runner, run(ElementsAre("iw", "dev"), _)).WillOnce(Return(exited(0, kIwDev)));
    EXPECT_CALL(runner, run(ElementsAre("iw", "dev", "wlan1", "station", "dump"), _)).WillOnce(Return(exited(0, kStationDump)));
    EXPECT_CALL(runner, run(ElementsAre("iw", "dev", "wlan0", "station", "dump"), _)).Times(0);

    FixedNeighborTable neighbors(runner, {{"192.168.4.10", "AA:BB:CC:00:00:01"}, {"192.168.4.11", "AA:BB:CC:00:00:02"}});
    // lease for station 2 carries a different address and a hostname: the lease wins
    DhcpLeaseSource leases(write_file("dnsmasq.leases", "1735689600 aa:bb:cc:00:00:02 192.168.4.20 phone *\n"), path("none"));
    WifiStationSource source(runner, neighbors, leases);

    auto stations = source.collect();
    ASSERT_EQ(stations.size(), 3u);
    EXPECT_EQ(stations[0].ip, "192.168.4.10");
    EXPECT_EQ(stations[0].name, "192.168.4.10");
    EXPECT_EQ(stations[1].ip, "192.168.4.20");
    EXPECT_EQ(stations[1].name, "phone");
    EXPECT_EQ(stations[2].ip, "");
    EXPECT_EQ(stations[2].name, "AA:BB:CC:00:00:03");
    for(const auto& s : stations){
        EXPECT_EQ(s.type, "wifi-station");
        EXPECT_EQ(s.status, DeviceStatus::Online);
        EXPECT_TRUE(s.mac.has_value());
    }
}

TEST_F(WifiStationSourceTest, NoIwMeansNoStations) {
    ON_CALL(runner, find_executable("iw")).WillByDefault(Return(std::nullopt));
    EXPECT_CALL(runner, run(_, _)).Times(0);
    FixedNeighborTable neighbors(runner, {});
    DhcpLeaseSource leases(path("a"), path("b"));
    WifiStationSource source(runner, neighbors, leases);
    EXPECT_TRUE(source.discover().empty());
}

TEST_F(WifiStationSourceTest, NoAccessPointInterfaces) {
    EXPECT_CALL(runner, run(ElementsAre("iw", "dev"), _)).WillOnce(Return(exited(0, "phy#0\n\tInterface wlan0\n\t\ttype managed\n")));
    FixedNeighborTable neighbors(runner, {});
    DhcpLeaseSource leases(path("a"), path("b"));
    WifiStationSource source(runner, neighbors, leases);
    EXPECT_TRUE(source.discover().empty());
}

}
