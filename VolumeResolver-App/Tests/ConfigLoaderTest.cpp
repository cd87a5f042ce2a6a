#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "utils/ConfigLoader.hpp"

namespace {

using nlohmann::json;

TEST(ConfigLoaderTest, ParsesFullConfig) {
    AppConfig cfg;
    std::string err;
    const json j = {
        {"volume", {{"target", "Active_Display"}}},
        {"api", {{"host", "0.0.0.0"}, {"port", 9000}, {"cors", false}}}
    };
    ASSERT_TRUE(ParseConfigStrict(cfg, err, j)) << err;
    EXPECT_EQ(cfg.target, TargetMode::ActiveDisplay);
    EXPECT_EQ(cfg.api.host, "0.0.0.0");
    EXPECT_EQ(cfg.api.port, 9000);
    EXPECT_FALSE(cfg.api.cors);
}

TEST(ConfigLoaderTest, ApiSectionIsOptional) {
    AppConfig cfg;
    std::string err;
    ASSERT_TRUE(ParseConfigStrict(cfg, err, json{ {"volume", {{"target", "builtin"}}} })) << err;
    EXPECT_EQ(cfg.target, TargetMode::Builtin);
    EXPECT_EQ(cfg.api.host, "127.0.0.1");
    EXPECT_EQ(cfg.api.port, 8766);
    EXPECT_TRUE(cfg.api.cors);
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
    AppConfig cfg;
    std::string err;

    EXPECT_FALSE(ParseConfigStrict(cfg, err, json::array()));
    EXPECT_FALSE(ParseConfigStrict(cfg, err, json{ {"api", json::object()} }));

    EXPECT_FALSE(ParseConfigStrict(cfg, err, json{ {"volume", {{"target", "speakers"}}} }));
    EXPECT_NE(err.find("speakers"), std::string::npos);

    const json badPort = { {"volume", {{"target", "builtin"}}}, {"api", {{"port", 70000}}} };
    EXPECT_FALSE(ParseConfigStrict(cfg, err, badPort));

    const json badCors = { {"volume", {{"target", "builtin"}}}, {"api", {{"cors", "yes"}}} };
    EXPECT_FALSE(ParseConfigStrict(cfg, err, badCors));

    const json emptyHost = { {"volume", {{"target", "builtin"}}}, {"api", {{"host", ""}}} };
    EXPECT_FALSE(ParseConfigStrict(cfg, err, emptyHost));
}

TEST(ConfigLoaderTest, ConfigToJsonParsesBack) {
    AppConfig in;
    in.target = TargetMode::ActiveDisplay;
    in.api.port = 1234;

    AppConfig out;
    std::string err;
    ASSERT_TRUE(ParseConfigStrict(out, err, ConfigToJson(in))) << err;
    EXPECT_EQ(out.target, TargetMode::ActiveDisplay);
    EXPECT_EQ(out.api.port, 1234);
}

TEST(ConfigLoaderTest, LoadReportsMissingAndMalformedFiles) {
    AppConfig cfg;
    std::string err;
    EXPECT_FALSE(LoadConfigStrict(cfg, err, "does/not/exist.json"));
    EXPECT_NE(err.find("does/not/exist.json"), std::string::npos);

    const std::string path = ::testing::TempDir() + "volume_resolver_bad.json";
    {
        std::ofstream f(path);
        f << "{ \"volume\": { // commento\n } }";
    }
    EXPECT_FALSE(LoadConfigStrict(cfg, err, path));
    EXPECT_NE(err.find("JSON"), std::string::npos);
    std::remove(path.c_str());
}

}  // namespace
