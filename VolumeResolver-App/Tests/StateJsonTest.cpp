#include <gtest/gtest.h>
#include "utils/StateJson.hpp"
#include "utils/Utils.hpp"

namespace {

TEST(StateJsonTest, FreshStateHasNoChange) {
    ObservableVolumeState s;
    s.rawVolume = 0.25f;
    const auto j = StateToJson(s);
    EXPECT_FLOAT_EQ(j["volume"].get<float>(), 0.25f);
    EXPECT_FALSE(j["muted"].get<bool>());
    EXPECT_TRUE(j["lastChangeAt"].is_null());
    EXPECT_TRUE(j["lastChangeTarget"].is_null());
    EXPECT_EQ(j["device"]["category"], "none");
}

TEST(StateJsonTest, ChangedStateCarriesTargetAndTimestamp) {
    ObservableVolumeState s;
    s.isMuted = true;
    s.lastChangeAt = std::chrono::system_clock::time_point(std::chrono::seconds(86400));
    s.lastChangeTarget = VolumeTarget::externalDisplay(7);
    s.activeDeviceName = "AirPods Pro";
    s.activeDeviceCategory = DeviceCategory::AirPodsPro;

    const auto j = StateToJson(s);
    EXPECT_TRUE(j["muted"].get<bool>());
    EXPECT_EQ(j["lastChangeAt"], "1970-01-02T00:00:00Z");
    EXPECT_EQ(j["lastChangeTarget"]["kind"], "external_display");
    EXPECT_EQ(j["lastChangeTarget"]["display"], 7);
    EXPECT_EQ(j["device"]["name"], "AirPods Pro");
    EXPECT_EQ(j["device"]["category"], "airpods_pro");
}

TEST(StateJsonTest, BuiltinTargetHasNoDisplay) {
    const auto j = TargetToJson(VolumeTarget::builtin());
    EXPECT_EQ(j["kind"], "builtin");
    EXPECT_FALSE(j.contains("display"));
}

}  // namespace
