#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Config.h"
#include "../src/core/Logging.h"
#include "../src/core/Report.h"
#include "../src/core/SourceRegistry.h"
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace lan_scan {

using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class MockSource : public EnrichmentSource {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::string, description, (), (const, override));
    MOCK_METHOD(SourceKind, kind, (), (const, override));
    MOCK_METHOD(std::vector<DeviceRecord>, collect, (), (override));
};

class SourceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override { set_config(Config{}); }
    void TearDown() override { set_config(Config{}); }

    MockSource* add(const std::string& name, SourceKind kind) {
        auto s = std::make_unique<NiceMock<MockSource>>();
        ON_CALL(*s, name()).WillByDefault(Return(name));
        ON_CALL(*s, description()).WillByDefault(Return(name + " source"));
        ON_CALL(*s, kind()).WillByDefault(Return(kind));
        auto* raw = s.get();
        registry.register_source(std::move(s));
        return raw;
    }
    static DeviceRecord at(const std::string& ip) { DeviceRecord d; d.ip = ip; return d; }

    SourceRegistry registry;
    Report report;
};

TEST_F(SourceRegistryTest, BatchesInRegistrationOrder) {
    auto* ssdp = add("ssdp", SourceKind::Ssdp);
    auto* leases = add("dhcp-leases", SourceKind::DhcpLeases);
    EXPECT_CALL(*ssdp, collect()).WillOnce(Return(std::vector<DeviceRecord>{at("10.0.0.1")}));
    EXPECT_CALL(*leases, collect()).WillOnce(Return(std::vector<DeviceRecord>{at("10.0.0.2"), at("10.0.0.3")}));
    auto batches = registry.run_all(report);
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_EQ(batches[0].source, "ssdp");
    EXPECT_EQ(batches[0].kind, SourceKind::Ssdp);
    EXPECT_EQ(batches[0].records.size(), 1u);
    EXPECT_EQ(batches[1].source, "dhcp-leases");
    EXPECT_EQ(batches[1].records.size(), 2u);
    EXPECT_TRUE(report.warnings().empty());
}

TEST_F(SourceRegistryTest, FailingSourceIsIsolated) {
    auto* ssdp = add("ssdp", SourceKind::Ssdp);
    auto* mdns = add("mdns", SourceKind::Mdns);
    EXPECT_CALL(*ssdp, collect()).WillOnce(Throw(std::runtime_error("ssdp socket: Operation not permitted")));
    EXPECT_CALL(*mdns, collect()).WillOnce(Return(std::vector<DeviceRecord>{at("10.0.0.8")}));
    std::vector<SourceBatch> batches;
    EXPECT_NO_THROW(batches = registry.run_all(report));
    ASSERT_EQ(batches.size(), 2u);
    EXPECT_TRUE(batches[0].records.empty());
    EXPECT_EQ(batches[1].records.size(), 1u);
    auto warnings = report.warnings();
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].first, "ssdp");
    EXPECT_EQ(warnings[0].second, "ssdp socket: Operation not permitted");
}

TEST_F(SourceRegistryTest, EnableListRestrictsSources) {
    Config cfg; cfg.enable_sources = {"mdns"};
    set_config(cfg);
    auto* ssdp = add("ssdp", SourceKind::Ssdp);
    auto* mdns = add("mdns", SourceKind::Mdns);
    EXPECT_CALL(*ssdp, collect()).Times(0);
    EXPECT_CALL(*mdns, collect()).WillOnce(Return(std::vector<DeviceRecord>{}));
    auto batches = registry.run_all(report);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].source, "mdns");
}

TEST_F(SourceRegistryTest, DisableListSkipsSources) {
    Config cfg; cfg.disable_sources = {"wifi-stations"};
    set_config(cfg);
    auto* wifi = add("wifi-stations", SourceKind::WifiStations);
    auto* leases = add("dhcp-leases", SourceKind::DhcpLeases);
    EXPECT_CALL(*wifi, collect()).Times(0);
    EXPECT_CALL(*leases, collect()).WillOnce(Return(std::vector<DeviceRecord>{}));
    EXPECT_FALSE(registry.is_enabled("wifi-stations"));
    EXPECT_TRUE(registry.is_enabled("dhcp-leases"));
    EXPECT_EQ(registry.run_all(report).size(), 1u);
    EXPECT_EQ(registry.names().size(), 2u);
}

TEST_F(SourceRegistryTest, DebugLogNamesSourceAndDescription) {
    auto* leases = add("dhcp-leases", SourceKind::DhcpLeases);
    EXPECT_CALL(*leases, collect()).WillOnce(Return(std::vector<DeviceRecord>{at("10.0.0.2")}));
    std::stringstream captured;
    auto* old = std::cerr.rdbuf(captured.rdbuf());
    Logger::instance().set_level(LogLevel::Debug);
    registry.run_all(report);
    Logger::instance().set_level(LogLevel::Info);
    std::cerr.rdbuf(old);
    std::string out = captured.str();
    EXPECT_NE(out.find("Starting source: dhcp-leases (dhcp-leases source)"), std::string::npos);
    EXPECT_NE(out.find("Finished source: dhcp-leases (1 records)"), std::string::npos);
}

}
