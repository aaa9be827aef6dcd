#include <gtest/gtest.h>

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <thread>

#include "TestSupport.h"
#include "infrastructure/transport/InMemoryProtocolClient.h"
#include "layers/application/DeviceRegistry.h"
#include "layers/transport/ServerLease.h"

using namespace application;
using std::chrono::milliseconds;
using testsupport::RecordingSink;
using testsupport::waitUntil;

namespace {

DeviceDescriptor descriptor(const std::string& address, const std::string& name = {}, bool enabled = true) {
    DeviceDescriptor d;
    d.address = address;
    d.displayName = name;
    d.enabled = enabled;
    return d;
}

class DeviceRegistryTests : public ::testing::Test {
protected:
    DeviceRegistryTests()
        : workGuard_(boost::asio::make_work_guard(io_)),
          lease_(client_, logging::Logger{}) {
        ioThread_ = std::thread([this]() { io_.run(); });
        createRegistry(false);
    }

    ~DeviceRegistryTests() override {
        registry_->closeAll();
        registry_.reset();
        workGuard_.reset();
        io_.stop();
        ioThread_.join();
    }

    void createRegistry(bool autoRegister) {
        if (registry_) {
            registry_->closeAll();
        }
        RegistrySettings settings;
        settings.defaultPollInterval = milliseconds(3600000);
        settings.firstPollDelay = milliseconds(3600000);
        settings.autoRegister = autoRegister;
        settings.session.commandTimeout = milliseconds(1000);
        settings.session.shutdownGrace = milliseconds(200);
        settings.session.reconnect.baseDelay = milliseconds(5000);
        settings.session.reconnect.jitter = 0.0;
        registry_ = std::make_unique<DeviceRegistry>(client_, lease_, io_, settings,
                                                     AdapterContext{sink_, logging::Logger{}, {}});
    }

    transport::InMemoryProtocolClient client_;
    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    std::thread ioThread_;
    transport::ServerLease lease_;
    RecordingSink sink_;
    std::unique_ptr<DeviceRegistry> registry_;
};

} // namespace

TEST_F(DeviceRegistryTests, UpsertCreatesDeviceWithSession) {
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error), UpsertOutcome::Created);

    const auto snapshot = registry_->snapshot("10_0_0_5");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->device.address, "10.0.0.5:5555");
    EXPECT_EQ(snapshot->device.displayName, "10.0.0.5:5555");
    EXPECT_EQ(snapshot->device.source, DeviceSource::Configuration);
    EXPECT_EQ(snapshot->sessionState, transport::SessionState::Disconnected);
    EXPECT_EQ(registry_->activeSessions(), 1u);

    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.5:5555"), DeviceSource::Configuration, error), UpsertOutcome::Unchanged);
    EXPECT_EQ(registry_->size(), 1u);
}

TEST_F(DeviceRegistryTests, ConfigurationWinsOverDiscoveryForSameAddress) {
    std::string error;
    registry_->upsert(descriptor("10.0.0.5", "Living room"), DeviceSource::Configuration, error);
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.5:5555", "AFTMM"), DeviceSource::Discovery, error),
              UpsertOutcome::Unchanged);

    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_EQ(registry_->activeSessions(), 1u);
    const auto snapshot = registry_->snapshot("10_0_0_5");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->device.displayName, "Living room");
    EXPECT_TRUE(snapshot->device.discovered);
}

TEST_F(DeviceRegistryTests, ConfigurationPromotesDiscoveredDevice) {
    createRegistry(true);
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.9", "AFTMM"), DeviceSource::Discovery, error), UpsertOutcome::Created);
    EXPECT_EQ(registry_->activeSessions(), 1u);

    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.9", "Bedroom", false), DeviceSource::Configuration, error),
              UpsertOutcome::Updated);

    const auto snapshot = registry_->snapshot("10_0_0_9");
    ASSERT_TRUE(snapshot.has_value());
    EXPECT_EQ(snapshot->device.source, DeviceSource::Configuration);
    EXPECT_EQ(snapshot->device.displayName, "Bedroom");
    EXPECT_FALSE(snapshot->device.enabled);
    EXPECT_EQ(registry_->activeSessions(), 0u);
}

TEST_F(DeviceRegistryTests, UnconfiguredDiscoveryIsIgnoredWithoutAutoRegister) {
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.9"), DeviceSource::Discovery, error), UpsertOutcome::Ignored);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(DeviceRegistryTests, MalformedAddressesAreRejected) {
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.300"), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
    EXPECT_EQ(registry_->upsert(descriptor("fe80::1"), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.5:0"), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
    EXPECT_EQ(registry_->upsert(descriptor(""), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(DeviceRegistryTests, DisabledDeviceEmitsNothingUntilReenabled) {
    testsupport::scriptHealthyDevice(client_, "10.0.0.5:5555");
    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);
    ASSERT_TRUE(registry_->pollNow("10_0_0_5"));
    ASSERT_EQ(sink_.writesFor("10_0_0_5", "connected").size(), 1u);

    ASSERT_TRUE(registry_->setEnabled("10_0_0_5", false, error));
    const auto disconnected = sink_.writesFor("10_0_0_5", "connected");
    ASSERT_EQ(disconnected.size(), 2u);
    EXPECT_EQ(disconnected.back().value, boost::json::value(false));
    EXPECT_EQ(registry_->activeSessions(), 0u);

    const auto before = sink_.size();
    EXPECT_FALSE(registry_->pollNow("10_0_0_5"));
    const auto result = registry_->execute({"10_0_0_5", protocol::CommandKind::KeyEvent, "3", {}});
    EXPECT_EQ(result.code, transport::CommandError::NotConnected);
    EXPECT_EQ(sink_.size(), before);

    ASSERT_TRUE(registry_->setEnabled("10_0_0_5", true, error));
    ASSERT_TRUE(registry_->pollNow("10_0_0_5"));
    EXPECT_GT(sink_.size(), before);
    EXPECT_EQ(sink_.writesFor("10_0_0_5", "connected").back().value, boost::json::value(true));
}

TEST_F(DeviceRegistryTests, RemoveEmitsExactlyOneDisconnect) {
    testsupport::scriptHealthyDevice(client_, "10.0.0.5:5555");
    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);
    ASSERT_TRUE(registry_->pollNow("10_0_0_5"));
    sink_.clear();

    ASSERT_TRUE(registry_->remove("10_0_0_5"));
    std::this_thread::sleep_for(milliseconds(50));

    const auto writes = sink_.writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].name, "connected");
    EXPECT_EQ(writes[0].value, boost::json::value(false));
    EXPECT_FALSE(registry_->snapshot("10_0_0_5").has_value());
    EXPECT_FALSE(registry_->remove("10_0_0_5"));
    EXPECT_EQ(lease_.users(), 0u);
}

TEST_F(DeviceRegistryTests, ExecuteRunsCommandOnDevice) {
    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);

    const auto result = registry_->execute({"10_0_0_5", protocol::CommandKind::KeyEvent, "KEYCODE_HOME", {}});
    EXPECT_TRUE(result.success) << result.error;

    const auto executed = client_.executed("10.0.0.5:5555");
    ASSERT_FALSE(executed.empty());
    EXPECT_EQ(executed.front(), "input keyevent KEYCODE_HOME");
}

TEST_F(DeviceRegistryTests, InvalidArgumentNeverReachesDevice) {
    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);

    const auto result = registry_->execute({"10_0_0_5", protocol::CommandKind::LaunchApp, "com.x; reboot", {}});
    EXPECT_EQ(result.code, transport::CommandError::InvalidArgument);
    EXPECT_EQ(client_.connectAttempts("10.0.0.5:5555"), 0u);

    const auto unknown = registry_->execute({"nope", protocol::CommandKind::KeyEvent, "3", {}});
    EXPECT_EQ(unknown.code, transport::CommandError::InvalidArgument);
}

TEST_F(DeviceRegistryTests, LaunchWithoutActivityIsExecutionFailure) {
    client_.setResponse("10.0.0.5:5555", "monkey -p com.missing -c android.intent.category.LAUNCHER 1",
                        "** No activities found to run, monkey aborted.\n");
    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);

    const auto result = registry_->execute({"10_0_0_5", protocol::CommandKind::LaunchApp, "com.missing", {}});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, transport::CommandError::ExecutionFailed);
}

TEST_F(DeviceRegistryTests, ApplyConfigurationMergesAndDropsStaleEntries) {
    std::vector<std::string> errors;
    registry_->applyConfiguration({descriptor("10.0.0.5"), descriptor("10.0.0.6"), descriptor("10.0.0.5:5555"),
                                   descriptor("bad host")},
                                  errors);
    EXPECT_EQ(registry_->size(), 2u);
    EXPECT_EQ(errors.size(), 2u);

    errors.clear();
    registry_->applyConfiguration({descriptor("10.0.0.6", "Kitchen")}, errors);
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(registry_->size(), 1u);
    EXPECT_FALSE(registry_->snapshot("10_0_0_5").has_value());
    EXPECT_EQ(registry_->snapshot("10_0_0_6")->device.displayName, "Kitchen");
}

TEST_F(DeviceRegistryTests, NonDefaultPortIsPartOfTheId) {
    std::string error;
    registry_->upsert(descriptor("10.0.0.5:5556"), DeviceSource::Configuration, error);
    EXPECT_TRUE(registry_->snapshot("10_0_0_5__5556").has_value());
    EXPECT_EQ(registry_->findIdByAddress("10.0.0.5:5556"), std::optional<std::string>("10_0_0_5__5556"));
    EXPECT_FALSE(registry_->findIdByAddress("10.0.0.5").has_value());
}

TEST_F(DeviceRegistryTests, HostnamesDifferingInSeparatorsGetDistinctIds) {
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("tv-1.lan"), DeviceSource::Configuration, error), UpsertOutcome::Created)
        << error;
    EXPECT_EQ(registry_->upsert(descriptor("tv.1.lan"), DeviceSource::Configuration, error), UpsertOutcome::Created)
        << error;
    EXPECT_EQ(registry_->upsert(descriptor("tv.1.lan:5556"), DeviceSource::Configuration, error),
              UpsertOutcome::Created)
        << error;
    EXPECT_EQ(registry_->size(), 3u);

    EXPECT_EQ(registry_->findIdByAddress("tv-1.lan"), std::optional<std::string>("tv-1_lan"));
    EXPECT_EQ(registry_->findIdByAddress("tv.1.lan"), std::optional<std::string>("tv_1_lan"));
    EXPECT_EQ(registry_->findIdByAddress("tv.1.lan:5556"), std::optional<std::string>("tv_1_lan__5556"));
}

TEST_F(DeviceRegistryTests, HostWithEmptyLabelIsRejected) {
    std::string error;
    EXPECT_EQ(registry_->upsert(descriptor("tv..lan"), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
    EXPECT_NE(error.find("empty label"), std::string::npos);
}

TEST_F(DeviceRegistryTests, CloseAllIsBoundedAndReleasesServer) {
    for (int i = 1; i <= 4; ++i) {
        client_.setReachable("10.0.1." + std::to_string(i) + ":5555", false);
    }
    testsupport::scriptHealthyDevice(client_, "10.0.0.5:5555");
    client_.setCommandDelay(milliseconds(5));

    std::string error;
    registry_->upsert(descriptor("10.0.0.5"), DeviceSource::Configuration, error);
    for (int i = 1; i <= 4; ++i) {
        registry_->upsert(descriptor("10.0.1." + std::to_string(i)), DeviceSource::Configuration, error);
        registry_->pollNow("10_0_1_" + std::to_string(i));
    }
    ASSERT_TRUE(registry_->pollNow("10_0_0_5"));
    EXPECT_TRUE(client_.serverRunning());

    const auto begin = std::chrono::steady_clock::now();
    registry_->closeAll();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, milliseconds(2000));

    EXPECT_EQ(lease_.users(), 0u);
    EXPECT_FALSE(client_.serverRunning());
    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(registry_->upsert(descriptor("10.0.0.8"), DeviceSource::Configuration, error), UpsertOutcome::Rejected);
}
