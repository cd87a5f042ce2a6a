#include <gtest/gtest.h>
#include "Core/Volume/VolumeManager.hpp"
#include "Fakes.hpp"

namespace {

using testing_fakes::FakeAudioHal;
using testing_fakes::FakeDdcTransport;
using testing_fakes::FakeDisplayEnvironment;
using testing_fakes::FakeScriptRunner;

constexpr DisplayId kExternal = 7;

class VolumeManagerTest : public ::testing::Test {
protected:
    // Esegue tutto il lavoro accodato: prima il worker, poi la pubblicazione su main
    void drain() {
        worker.run();
        worker.restart();
        main.run();
        main.restart();
    }

    ExternalDisplayVolumeController::TransportFactory ddcFactory() {
        return [this](DisplayId) -> std::unique_ptr<DdcTransport> {
            auto t = std::make_unique<FakeDdcTransport>();
            t->online = ddcOnline;
            ddc = t.get();
            return t;
        };
    }

    asio::io_context main;
    asio::io_context worker;

    FakeAudioHal hal;
    FakeDisplayEnvironment displays;
    FakeScriptRunner runner;
    FakeDdcTransport* ddc = nullptr;
    bool ddcOnline = true;
    TargetMode mode = TargetMode::Builtin;
    int feedbacks = 0;

    CoreAudioBackend audio{ hal };
    ScriptingFallbackBackend scripting{ worker, runner,
                                        [this] { return main.get_executor().running_in_this_thread(); } };
    ExternalDisplayVolumeController external{ displays, { ddcFactory() } };
    VolumeManager manager{ main, worker, external, audio, scripting, displays,
                           [this] { return mode; }, [this] { ++feedbacks; } };
};

TEST_F(VolumeManagerTest, SetAbsoluteLandsWithinTolerance) {
    for (float v : { 0.25f, 0.5f, 0.9f, 1.4f }) {
        manager.setAbsolute(v);
        drain();
        EXPECT_NEAR(manager.state().rawVolume, clampVolume(v), 0.02f) << v;
        EXPECT_NEAR(hal.virtualVolume, clampVolume(v), 0.02f) << v;
        EXPECT_FALSE(manager.state().isMuted);
    }
    EXPECT_EQ(manager.lastTier(), VolumeManager::Tier::CoreAudio);
    EXPECT_EQ(manager.state().lastChangeTarget, std::optional<VolumeTarget>(VolumeTarget::builtin()));
}

TEST_F(VolumeManagerTest, StepUpThenDownReturnsToStart) {
    hal.virtualVolume = 0.5f;
    manager.increase();
    drain();
    EXPECT_NEAR(manager.state().rawVolume, 0.5f + kVolumeStep, 1e-4f);

    manager.decrease();
    drain();
    EXPECT_NEAR(manager.state().rawVolume, 0.5f, 1e-4f);

    manager.increase(4.f);
    drain();
    EXPECT_NEAR(hal.virtualVolume, 0.5f + kVolumeStep / 4.f, 1e-4f);
}

TEST_F(VolumeManagerTest, StepsClampAtBounds) {
    hal.virtualVolume = 0.98f;
    manager.increase();
    drain();
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 1.f);

    hal.virtualVolume = 0.01f;
    manager.decrease();
    drain();
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.f);
    EXPECT_TRUE(manager.state().isMuted);
}

TEST_F(VolumeManagerTest, SoftwareMuteRestoresExactVolume) {
    manager.setAbsolute(0.6f);
    drain();

    manager.toggleMute();
    drain();
    EXPECT_TRUE(manager.state().isMuted);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.f);
    EXPECT_FLOAT_EQ(hal.virtualVolume, 0.f);

    manager.toggleMute();
    drain();
    EXPECT_FALSE(manager.state().isMuted);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.6f);
    EXPECT_FLOAT_EQ(hal.virtualVolume, 0.6f);
}

TEST_F(VolumeManagerTest, MuteAtZeroDoesNothing) {
    hal.virtualVolume = 0.f;
    manager.toggleMute();
    drain();
    EXPECT_EQ(hal.setVirtualCalls, 0);
    EXPECT_FALSE(manager.state().isMuted);
}

TEST_F(VolumeManagerTest, SettingZeroMutesAndUnmuteRestoresLastAudible) {
    manager.setAbsolute(0.4f);
    manager.setAbsolute(0.f);
    drain();
    EXPECT_TRUE(manager.state().isMuted);

    manager.toggleMute();
    drain();
    EXPECT_FALSE(manager.state().isMuted);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.4f);
}

TEST_F(VolumeManagerTest, HardwareMuteIsToggledWhenAvailable) {
    hal.mute = false;
    manager.toggleMute();
    drain();
    EXPECT_EQ(hal.mute, std::optional<bool>(true));
    EXPECT_TRUE(manager.state().isMuted);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.5f);

    manager.toggleMute();
    drain();
    EXPECT_EQ(hal.mute, std::optional<bool>(false));
    EXPECT_FALSE(manager.state().isMuted);
}

TEST_F(VolumeManagerTest, UnverifiedCoreAudioFallsThroughToScript) {
    hal.hasVirtual = false;
    manager.setAbsolute(0.3f);
    drain();

    EXPECT_EQ(manager.lastTier(), VolumeManager::Tier::Scripting);
    const auto sets = runner.setScripts();
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_NE(sets[0].find("output volume 30"), std::string::npos);
    EXPECT_NEAR(manager.state().rawVolume, 0.3f, 1e-4f);
}

TEST_F(VolumeManagerTest, ScriptWritesAreDebounced) {
    hal.device = kNoAudioDevice;
    runner.readSucceeds = false;

    for (int i = 0; i < 5; ++i) manager.increase();
    drain();

    const auto sets = runner.setScripts();
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_NE(sets[0].find("output volume 31"), std::string::npos);
}

TEST_F(VolumeManagerTest, ScriptStepsAccumulateBeforeWriteLands) {
    hal.device = kNoAudioDevice;
    runner.readOutput = "50\n";

    for (int i = 0; i < 5; ++i) manager.increase();
    drain();

    const auto sets = runner.setScripts();
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_NE(sets[0].find("output volume 81"), std::string::npos);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.8125f);
}

TEST_F(VolumeManagerTest, UnappliedHalWriteStillAccumulatesSteps) {
    hal.hasVirtual = false;
    hal.scalars = { { kMainElement, 0.5f } };
    hal.scalarsApply = false;

    manager.increase();
    manager.increase();
    drain();

    EXPECT_EQ(manager.lastTier(), VolumeManager::Tier::Scripting);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.5f + 2 * kVolumeStep);
    const auto sets = runner.setScripts();
    ASSERT_EQ(sets.size(), 1u);
    EXPECT_NE(sets[0].find("output volume 63"), std::string::npos);
}

TEST_F(VolumeManagerTest, SoftwareMuteRestoresQuietVolumeExactly) {
    manager.setAbsolute(0.03f);
    drain();

    manager.toggleMute();
    drain();
    EXPECT_TRUE(manager.state().isMuted);

    manager.toggleMute();
    drain();
    EXPECT_FALSE(manager.state().isMuted);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.03f);
    EXPECT_FLOAT_EQ(hal.virtualVolume, 0.03f);
}

TEST_F(VolumeManagerTest, ExternalDisplayUsesDdc) {
    mode = TargetMode::ActiveDisplay;
    displays.active = { 1, kExternal };

    manager.setAbsolute(0.3f, kExternal);
    drain();

    ASSERT_NE(ddc, nullptr);
    EXPECT_EQ(ddc->current, 30);
    EXPECT_EQ(hal.setVirtualCalls, 0);
    EXPECT_EQ(manager.lastTier(), VolumeManager::Tier::ExternalDisplay);
    EXPECT_EQ(manager.state().lastChangeTarget, std::optional<VolumeTarget>(VolumeTarget::externalDisplay(kExternal)));
}

TEST_F(VolumeManagerTest, ExternalMuteRoundTrip) {
    mode = TargetMode::ActiveDisplay;
    displays.active = { 1, kExternal };
    displays.pointer = kExternal;

    manager.setAbsolute(0.6f);
    manager.toggleMute();
    drain();
    ASSERT_NE(ddc, nullptr);
    EXPECT_EQ(ddc->current, 0);
    EXPECT_TRUE(manager.state().isMuted);

    manager.toggleMute();
    drain();
    EXPECT_EQ(ddc->current, 60);
    EXPECT_FALSE(manager.state().isMuted);
    EXPECT_EQ(hal.setVirtualCalls, 0);
}

TEST_F(VolumeManagerTest, UnreachableDisplayFallsBackToBuiltinDevice) {
    mode = TargetMode::ActiveDisplay;
    ddcOnline = false;

    manager.setAbsolute(0.45f, kExternal);
    drain();

    EXPECT_FLOAT_EQ(hal.virtualVolume, 0.45f);
    EXPECT_EQ(manager.lastTier(), VolumeManager::Tier::CoreAudio);
    EXPECT_EQ(external.cachedTransportCount(), 0u);
}

TEST_F(VolumeManagerTest, RefreshDoesNotTouchTimestamp) {
    hal.virtualVolume = 0.7f;
    manager.refresh();
    drain();

    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.7f);
    EXPECT_EQ(manager.state().lastChangeAt, std::chrono::system_clock::time_point{});
    EXPECT_FALSE(manager.state().lastChangeTarget.has_value());
}

TEST_F(VolumeManagerTest, HalChangesAfterStartArePublished) {
    std::vector<ObservableVolumeState> seen;
    manager.subscribe([&](const ObservableVolumeState& s) { seen.push_back(s); });

    manager.start();
    drain();
    ASSERT_FALSE(seen.empty());
    EXPECT_FLOAT_EQ(seen.back().rawVolume, 0.5f);
    EXPECT_EQ(seen.back().lastChangeAt, std::chrono::system_clock::time_point{});

    hal.virtualVolume = 0.3f;
    hal.fire(HalChange::Volume);
    drain();
    EXPECT_FLOAT_EQ(seen.back().rawVolume, 0.3f);
    EXPECT_NE(seen.back().lastChangeAt, std::chrono::system_clock::time_point{});

    manager.stop();
    EXPECT_FALSE(static_cast<bool>(hal.listener));
}

TEST_F(VolumeManagerTest, ReconfigurationDropsDisconnectedDisplays) {
    mode = TargetMode::ActiveDisplay;
    displays.active = { 1, kExternal };
    manager.start();

    manager.setAbsolute(0.3f, kExternal);
    drain();
    EXPECT_EQ(external.cachedTransportCount(), 1u);

    displays.active = { 1 };
    displays.reconfigure();
    drain();
    EXPECT_EQ(external.cachedTransportCount(), 0u);
}

TEST_F(VolumeManagerTest, StaleDisplaysDroppedWithoutReconfigurationEvent) {
    mode = TargetMode::ActiveDisplay;
    displays.active = { 1, kExternal };

    manager.setAbsolute(0.3f, kExternal);
    drain();
    EXPECT_EQ(external.cachedTransportCount(), 1u);
    EXPECT_TRUE(external.canControl(kExternal));

    // display scollegato e uno nuovo collegato, nessuna notifica
    displays.active = { 1, 9 };
    manager.setAbsolute(0.4f, 9);
    drain();
    EXPECT_EQ(external.cachedTransportCount(), 1u);
    EXPECT_EQ(ddc->current, 40);
}

TEST_F(VolumeManagerTest, DefaultDeviceChangeReattachesOnWorker) {
    manager.start();
    drain();
    EXPECT_EQ(hal.followCalls, 0);

    hal.fire(HalChange::Volume);
    drain();
    EXPECT_EQ(hal.followCalls, 0);

    hal.virtualVolume = 0.8f;
    hal.fire(HalChange::DefaultDevice);
    EXPECT_EQ(hal.followCalls, 0);
    drain();
    EXPECT_EQ(hal.followCalls, 1);
    EXPECT_FLOAT_EQ(manager.state().rawVolume, 0.8f);
}

TEST_F(VolumeManagerTest, FeedbackOnlyWhenLeavingSilence) {
    manager.setAbsolute(0.5f);
    drain();
    EXPECT_EQ(feedbacks, 1);

    manager.setAbsolute(0.6f);
    drain();
    EXPECT_EQ(feedbacks, 1);
}

TEST_F(VolumeManagerTest, IconReflectsLevelAndDevice) {
    EXPECT_EQ(manager.iconFor(0.5f, true), "speaker.slash.fill");
    EXPECT_EQ(manager.iconFor(0.f, false), "speaker.slash.fill");
    EXPECT_EQ(manager.iconFor(0.2f, false), "speaker.wave.1.fill");
    EXPECT_EQ(manager.iconFor(0.5f, false), "speaker.wave.2.fill");
    EXPECT_EQ(manager.iconFor(0.9f, false), "speaker.wave.3.fill");

    hal.name = "AirPods Pro";
    hal.transport = AudioTransport::Bluetooth;
    manager.refresh();
    drain();
    EXPECT_EQ(manager.state().activeDeviceCategory, DeviceCategory::AirPodsPro);
    EXPECT_EQ(manager.iconFor(0.5f, false), "airpodspro");
    EXPECT_TRUE(manager.supportsVolumeControl());
}

}  // namespace
