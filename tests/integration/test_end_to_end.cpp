#include "logging/logger.h"
#include "monitor/discovery_loop.h"
#include "monitor/discovery_trigger.h"
#include "monitor/network_monitor.h"
#include "monitor/polling_loop.h"
#include "monitor/worker_pool.h"
#include "probe/prober.h"
#include "registry/device_registry.h"
#include "store/device_store.h"
#include "support/stubs.h"

#include <fstream>
#include <gtest/gtest.h>
#include <thread>

using namespace netwatch;
using namespace netwatch::testing;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

const std::string kMacX = "aa:00:00:00:00:0a";
const std::string kMacY = "aa:00:00:00:00:0b";
const std::string kMacZ = "aa:00:00:00:00:0c";

ConfigOverlay make_overlay(int ping_count) {
    DeviceConfig defaults;
    defaults.ping_count = ping_count;
    defaults.ping_timeout = seconds(1);
    defaults.polling_interval = seconds(3);

    DeviceOverride tuya;
    tuya.pattern = "Tuya.*";
    tuya.overrides.polling_interval = seconds(60);

    DeviceOverride ignored;
    ignored.pattern = "Printer";
    ignored.overrides.disabled = true;

    return ConfigOverlay(defaults, {tuya, ignored});
}

// Registry, store, discovery and polling wired by hand so each cycle can be
// driven synchronously.
class MonitorHarness : public ::testing::Test {
protected:
    MonitorHarness()
        : tmp_("netwatch_e2e"),
          logger_((tmp_.path() / "monitor.log").string(), LogLevel::DEBUG),
          registry_(make_overlay(3)),
          store_(tmp_.path() / "devices"),
          backend_(new ScriptedProbeBackend()),
          prober_(std::unique_ptr<IProbeBackend>(backend_)),
          trigger_(tmp_.path() / "discover.now"),
          pool_(4),
          vendors_({{kMacZ, "TuyaSmartPlug"}}),
          discovery_(registry_, scanner_, vendors_, trigger_, logger_,
                     {"192.168.1.0/24", seconds(300), seconds(1)}),
          polling_(registry_, prober_, store_, pool_, logger_,
                   {seconds(3), seconds(0)}) {
        polling_.set_sleeper([this](std::chrono::steady_clock::time_point deadline) {
            deadlines_.push_back(deadline);
            return true;
        });
    }

    void discover(std::vector<DiscoveredHost> hosts) {
        scanner_.set_hosts(std::move(hosts));
        discovery_.run_once();
    }

    std::vector<std::string> store_lines(const std::string& mac) {
        return read_lines(store_.path_for(mac));
    }

    TempDir tmp_;
    Logger logger_;
    DeviceRegistry registry_;
    DeviceStore store_;
    ScriptedProbeBackend* backend_;
    Prober prober_;
    DiscoveryTrigger trigger_;
    WorkerPool pool_;
    StubScanner scanner_;
    StubVendorResolver vendors_;
    DiscoveryLoop discovery_;
    PollingLoop polling_;
    std::vector<std::chrono::steady_clock::time_point> deadlines_;
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <typename Pred>
bool wait_for(Pred pred, milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(milliseconds(20));
    }
    return pred();
}

} // namespace

TEST_F(MonitorHarness, MixedProbeResultsAcrossThreeDevices) {
    discover({{"192.168.1.10", kMacX}, {"192.168.1.11", kMacY}, {"192.168.1.12", kMacZ}});
    ASSERT_EQ(registry_.size(), 3u);

    backend_->script("192.168.1.10", {false, false, false});
    backend_->script("192.168.1.11", {false, true, false});
    backend_->script("192.168.1.12", {true});

    auto report = polling_.run_cycle(Clock::now());
    EXPECT_EQ(report.probed, 3u);
    EXPECT_EQ(report.transitions, 3u);
    EXPECT_EQ(report.offline, 1u);
    EXPECT_EQ(report.online, 2u);

    EXPECT_EQ(registry_.find(kMacX)->status, DeviceStatus::OFFLINE);
    EXPECT_EQ(backend_->attempts("192.168.1.10"), 3);

    EXPECT_EQ(registry_.find(kMacY)->status, DeviceStatus::ONLINE);
    EXPECT_EQ(backend_->attempts("192.168.1.11"), 2);

    EXPECT_EQ(registry_.find(kMacZ)->status, DeviceStatus::ONLINE);
    EXPECT_EQ(backend_->attempts("192.168.1.12"), 1);

    auto x_lines = store_lines(kMacX);
    ASSERT_EQ(x_lines.size(), 1u);
    EXPECT_TRUE(ends_with(x_lines[0], ",offline,0.0")) << x_lines[0];
    EXPECT_NE(x_lines[0].find(",192.168.1.10," + kMacX + ","), std::string::npos);

    auto y_lines = store_lines(kMacY);
    ASSERT_EQ(y_lines.size(), 1u);
    EXPECT_TRUE(ends_with(y_lines[0], ",online,0.0")) << y_lines[0];
}

TEST_F(MonitorHarness, ProbesAreStaggeredAcrossTheInterval) {
    discover({{"192.168.1.10", kMacX}, {"192.168.1.11", kMacY}, {"192.168.1.13", "aa:00:00:00:00:0d"}});

    polling_.run_cycle(Clock::now());

    ASSERT_EQ(deadlines_.size(), 3u);
    EXPECT_EQ(deadlines_[1] - deadlines_[0], milliseconds(1000));
    EXPECT_EQ(deadlines_[2] - deadlines_[1], milliseconds(1000));
}

TEST_F(MonitorHarness, UnchangedResultsWriteNothing) {
    discover({{"192.168.1.10", kMacX}});
    backend_->script("192.168.1.10", {true});

    auto t0 = Clock::now();
    polling_.run_cycle(t0);
    auto second = polling_.run_cycle(t0 + seconds(3));
    auto third = polling_.run_cycle(t0 + seconds(6));

    EXPECT_EQ(second.probed, 1u);
    EXPECT_EQ(second.transitions, 0u);
    EXPECT_EQ(third.transitions, 0u);
    EXPECT_EQ(store_lines(kMacX).size(), 1u);
}

TEST_F(MonitorHarness, RecoveryAfterOutageRecordsTimeOffline) {
    discover({{"192.168.1.10", kMacX}});

    backend_->script("192.168.1.10", {false});
    auto t0 = Clock::now();
    polling_.run_cycle(t0);

    std::this_thread::sleep_for(milliseconds(1100));
    backend_->script("192.168.1.10", {true});
    auto report = polling_.run_cycle(t0 + seconds(3));
    EXPECT_EQ(report.transitions, 1u);

    auto lines = store_lines(kMacX);
    ASSERT_EQ(lines.size(), 2u);
    auto entry = parse_entry(lines[1]);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->status, DeviceStatus::ONLINE);
    EXPECT_GE(entry->seconds_since_transition, 1.0);
}

TEST_F(MonitorHarness, RediscoveryWithNewIpKeepsState) {
    discover({{"192.168.1.10", kMacX}});
    backend_->script("192.168.1.10", {true});
    polling_.run_cycle(Clock::now());

    auto before = *registry_.find(kMacX);
    ASSERT_EQ(before.status, DeviceStatus::ONLINE);
    ASSERT_EQ(store_lines(kMacX).size(), 1u);

    scanner_.set_hosts({{"192.168.1.77", kMacX}});
    auto report = discovery_.run_once();
    EXPECT_EQ(report.ip_changed, 1u);
    EXPECT_EQ(report.inserted, 0u);

    auto after = *registry_.find(kMacX);
    EXPECT_EQ(after.ip, "192.168.1.77");
    EXPECT_EQ(after.status, DeviceStatus::ONLINE);
    EXPECT_EQ(after.last_transition, before.last_transition);
    EXPECT_EQ(store_lines(kMacX).size(), 1u);

    // Polling follows the new address without a spurious transition
    backend_->script("192.168.1.77", {true});
    auto cycle = polling_.run_cycle(Clock::now() + seconds(3));
    EXPECT_EQ(cycle.transitions, 0u);
    EXPECT_EQ(backend_->attempts("192.168.1.77"), 1);
    EXPECT_EQ(store_lines(kMacX).size(), 1u);
}

TEST_F(MonitorHarness, RepeatedDiscoveryIsIdempotent) {
    std::vector<DiscoveredHost> hosts = {{"192.168.1.10", kMacX}, {"192.168.1.11", kMacY}};
    discover(hosts);
    auto first = registry_.snapshot();

    auto report = discovery_.run_once();
    EXPECT_EQ(report.inserted, 0u);
    EXPECT_EQ(report.ip_changed, 0u);
    EXPECT_EQ(report.unchanged, 2u);

    auto second = registry_.snapshot();
    ASSERT_EQ(second.size(), first.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(second[i].mac, first[i].mac);
        EXPECT_EQ(second[i].ip, first[i].ip);
        EXPECT_EQ(second[i].vendor, first[i].vendor);
        EXPECT_EQ(second[i].status, first[i].status);
        EXPECT_EQ(second[i].first_seen, first[i].first_seen);
        EXPECT_GE(second[i].last_seen, first[i].last_seen);
    }
}

TEST_F(MonitorHarness, DevicesMissingFromSweepAreKept) {
    discover({{"192.168.1.10", kMacX}, {"192.168.1.11", kMacY}});
    backend_->script("192.168.1.11", {true});
    polling_.run_cycle(Clock::now());

    discover({{"192.168.1.10", kMacX}});

    EXPECT_EQ(registry_.size(), 2u);
    EXPECT_EQ(registry_.find(kMacY)->status, DeviceStatus::ONLINE);
}

TEST_F(MonitorHarness, VendorOverlaySlowsPollingForMatchingDevices) {
    // kMacZ resolves to "TuyaSmartPlug": 60s instead of the global 3s
    discover({{"192.168.1.10", kMacX}, {"192.168.1.12", kMacZ}});
    ASSERT_EQ(registry_.find(kMacZ)->vendor, "TuyaSmartPlug");
    backend_->script("192.168.1.10", {true});
    backend_->script("192.168.1.12", {true});

    auto t0 = Clock::now();
    EXPECT_EQ(polling_.run_cycle(t0).probed, 2u);

    for (int s = 3; s < 60; s += 3) {
        auto due = polling_.due_devices(t0 + seconds(s));
        ASSERT_EQ(due.size(), 1u) << "at t+" << s;
        EXPECT_EQ(due[0].device.mac, kMacX);
        EXPECT_EQ(due[0].config.polling_interval, seconds(3));
        polling_.run_cycle(t0 + seconds(s));
    }

    auto due = polling_.due_devices(t0 + seconds(60));
    ASSERT_EQ(due.size(), 2u);
    EXPECT_EQ(due[1].device.mac, kMacZ);
    EXPECT_EQ(due[1].config.polling_interval, seconds(60));
    EXPECT_EQ(backend_->attempts("192.168.1.12"), 1);
    polling_.run_cycle(t0 + seconds(60));
    EXPECT_EQ(backend_->attempts("192.168.1.12"), 2);
}

TEST_F(MonitorHarness, DisabledDevicesAreNeverProbed) {
    StubVendorResolver printer_vendors({{kMacY, "Printer Co"}});
    DiscoveryLoop discovery(registry_, scanner_, printer_vendors, trigger_, logger_,
                            {"192.168.1.0/24", seconds(300), seconds(1)});
    scanner_.set_hosts({{"192.168.1.11", kMacY}});
    discovery.run_once();

    auto report = polling_.run_cycle(Clock::now());
    EXPECT_EQ(report.due, 0u);
    EXPECT_EQ(backend_->attempts("192.168.1.11"), 0);
    EXPECT_EQ(registry_.find(kMacY)->status, DeviceStatus::UNKNOWN);
}

TEST_F(MonitorHarness, VendorIsResolvedOncePerDevice) {
    discover({{"192.168.1.12", kMacZ}});
    discovery_.run_once();
    discovery_.run_once();
    EXPECT_EQ(vendors_.calls(), 1);
}

TEST_F(MonitorHarness, HeartbeatWrittenWhenEnabled) {
    PollingLoop polling(registry_, prober_, store_, pool_, logger_, {seconds(3), seconds(1)});
    polling.set_sleeper([](std::chrono::steady_clock::time_point) { return true; });

    discover({{"192.168.1.10", kMacX}});
    backend_->script("192.168.1.10", {true});

    auto t0 = Clock::now();
    polling.run_cycle(t0);
    auto quick = polling.run_cycle(t0 + seconds(3));
    EXPECT_EQ(quick.heartbeats, 0u);

    std::this_thread::sleep_for(milliseconds(1100));
    auto later = polling.run_cycle(t0 + seconds(6));
    EXPECT_EQ(later.heartbeats, 1u);

    auto lines = store_lines(kMacX);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[1].find(",online,"), std::string::npos);
}

TEST_F(MonitorHarness, TriggerFileForcesDiscoveryAndIsRemoved) {
    scanner_.set_hosts({{"192.168.1.10", kMacX}});
    discovery_.start();
    ASSERT_TRUE(wait_for([&] { return scanner_.scan_count() >= 1; }, milliseconds(3000)));

    std::ofstream(trigger_.path()) << "";
    ASSERT_TRUE(trigger_.pending());

    EXPECT_TRUE(wait_for([&] { return scanner_.scan_count() >= 2; }, milliseconds(5000)));
    EXPECT_TRUE(wait_for([&] { return !trigger_.pending(); }, milliseconds(5000)));
    discovery_.stop();

    EXPECT_EQ(scanner_.last_subnet(), "192.168.1.0/24");
}

TEST(NetworkMonitor, RecoversPersistedDevicesAndMonitorsNewOnes) {
    TempDir tmp("netwatch_monitor");
    MonitorConfig config;
    config.subnet = "10.9.0.0/24";
    config.devices_dir = (tmp.path() / "devices").string();
    config.discovery_trigger_file = (tmp.path() / "discover.now").string();
    config.polling_interval = seconds(1);
    config.parallel_ping_workers = 2;

    std::filesystem::create_directories(config.devices_dir);
    std::ofstream(std::filesystem::path(config.devices_dir) / "aa:00:00:00:00:01")
        << "2026-03-01T10:00:00Z,10.9.0.1,aa:00:00:00:00:01,offline,0.0\n";

    Logger logger((tmp.path() / "monitor.log").string());

    auto* scanner = new StubScanner();
    scanner->set_hosts({{"10.9.0.2", "aa:00:00:00:00:02"}});
    auto* backend = new ScriptedProbeBackend();
    backend->script("10.9.0.2", {true});

    Collaborators c;
    c.scanner.reset(scanner);
    c.probe_backend.reset(backend);
    c.vendor_resolver = std::make_unique<StubVendorResolver>();

    NetworkMonitor monitor(config, logger, std::move(c));

    auto recovered = monitor.registry().find("aa:00:00:00:00:01");
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(recovered->status, DeviceStatus::OFFLINE);
    EXPECT_EQ(recovered->ip, "10.9.0.1");

    monitor.start();
    auto new_log = monitor.store().path_for("aa:00:00:00:00:02");
    EXPECT_TRUE(wait_for([&] { return read_lines(new_log).size() == 1; }, milliseconds(8000)));
    monitor.stop();

    EXPECT_EQ(monitor.registry().find("aa:00:00:00:00:02")->status, DeviceStatus::ONLINE);
    EXPECT_EQ(monitor.registry().size(), 2u);
}
