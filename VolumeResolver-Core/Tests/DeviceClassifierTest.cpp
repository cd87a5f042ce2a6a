#include <gtest/gtest.h>
#include "Core/Audio/DeviceClassifier.hpp"

namespace {

TEST(DeviceClassifierTest, AppleFamilies) {
    EXPECT_EQ(ClassifyOutputDevice("Marco's AirPods Pro", true), DeviceCategory::AirPodsPro);
    EXPECT_EQ(ClassifyOutputDevice("AirPods Max", true), DeviceCategory::AirPodsMax);
    EXPECT_EQ(ClassifyOutputDevice("AirPods (3rd generation)", true), DeviceCategory::AirPodsGen3);
    EXPECT_EQ(ClassifyOutputDevice("AIRPODS", false), DeviceCategory::AirPods);
    EXPECT_EQ(ClassifyOutputDevice("Beats Studio Buds", true), DeviceCategory::Beats);
}

TEST(DeviceClassifierTest, ThirdPartyFamilies) {
    EXPECT_EQ(ClassifyOutputDevice("Bose QuietComfort 45", true), DeviceCategory::Headphones);
    EXPECT_EQ(ClassifyOutputDevice("Galaxy Buds2", true), DeviceCategory::Earbuds);
    EXPECT_EQ(ClassifyOutputDevice("WH-1000XM5", true), DeviceCategory::Headphones);
}

TEST(DeviceClassifierTest, UnknownNames) {
    EXPECT_EQ(ClassifyOutputDevice("", false), DeviceCategory::None);
    EXPECT_EQ(ClassifyOutputDevice("MacBook Pro Speakers", false), DeviceCategory::None);
    EXPECT_EQ(ClassifyOutputDevice("Car Audio", true), DeviceCategory::Headphones);
}

TEST(DeviceClassifierTest, SymbolNames) {
    EXPECT_STREQ(SymbolForCategory(DeviceCategory::AirPodsPro), "airpodspro");
    EXPECT_STREQ(SymbolForCategory(DeviceCategory::Headphones), "headphones");
    EXPECT_EQ(SymbolForCategory(DeviceCategory::None), nullptr);
}

}  // namespace
