/**
 * @file test_config.cpp
 * @brief Configuration defaults, file loading and typed getters
 */

#include <gtest/gtest.h>
#include "sniax_config.hpp"

#include <fstream>

using namespace sniax;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::instance().clear();
        Config::instance().loadDefaults();
    }

    void TearDown() override {
        Config::instance().clear();
        Config::instance().loadDefaults();
    }
};

TEST_F(ConfigTest, Defaults) {
    auto& cfg = Config::instance();
    EXPECT_EQ(cfg.getInt("axfr.delay_ms"), 1000);
    EXPECT_EQ(cfg.getInt("axfr.attempts"), 3);
    EXPECT_EQ(cfg.getInt("axfr.backoff_ms"), 2000);
    EXPECT_EQ(cfg.getInt("axfr.read_size"), 512);
    EXPECT_EQ(cfg.getInt("axfr.port"), 53);
    EXPECT_EQ(cfg.getInt("sni.port"), 443);
    EXPECT_FALSE(cfg.getBool("sni.parallel", true));
    EXPECT_EQ(cfg.get("log.level"), "info");
}

TEST_F(ConfigTest, LoadFromFileOverrides) {
    std::string path = ::testing::TempDir() + "sniax_test.conf";
    {
        std::ofstream out(path);
        out << "# timing\n"
            << "axfr.delay_ms = 250\n"
            << "; pools\n"
            << "scan.max_domains=2\n"
            << "sni.parallel = yes\r\n"
            << "not a setting\n";
    }

    auto& cfg = Config::instance();
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getInt("axfr.delay_ms"), 250);
    EXPECT_EQ(cfg.getInt("scan.max_domains"), 2);
    EXPECT_TRUE(cfg.getBool("sni.parallel"));
    EXPECT_EQ(cfg.getInt("axfr.attempts"), 3);
}

TEST_F(ConfigTest, MissingFile) {
    EXPECT_FALSE(Config::instance().loadFromFile("/nonexistent-dir/sniax.conf"));
}

TEST_F(ConfigTest, TypedGettersFallBack) {
    auto& cfg = Config::instance();
    cfg.set("axfr.delay_ms", "soon");
    cfg.set("huge", "99999999999999999999");
    EXPECT_EQ(cfg.getInt("axfr.delay_ms", 42), 42);
    EXPECT_EQ(cfg.getInt("huge", 7), 7);
    EXPECT_EQ(cfg.getInt("absent", 9), 9);
    EXPECT_TRUE(cfg.getBool("absent", true));

    cfg.setInt("scan.max_probes", 4);
    cfg.setBool("sni.parallel", true);
    EXPECT_EQ(cfg.getInt("scan.max_probes"), 4);
    EXPECT_TRUE(cfg.getBool("sni.parallel"));
}

TEST_F(ConfigTest, StrictGetterNamesTheBadKey) {
    auto& cfg = Config::instance();
    cfg.set("scan.max_probes", "-4");
    try {
        cfg.getIntInRange("scan.max_probes", 16, 1, 1024);
        FAIL() << "negative pool size accepted";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("scan.max_probes"), std::string::npos);
    }

    cfg.set("sni.port", "443x");
    EXPECT_THROW(cfg.getIntInRange("sni.port", 443, 1, 65535), ConfigError);
    cfg.set("sni.port", "99999999999999999999");
    EXPECT_THROW(cfg.getIntInRange("sni.port", 443, 1, 65535), ConfigError);
}

TEST_F(ConfigTest, StrictGetterAcceptsBoundsAndDefaults) {
    auto& cfg = Config::instance();
    cfg.set("axfr.port", "65535");
    EXPECT_EQ(cfg.getIntInRange("axfr.port", 53, 1, 65535), 65535);
    cfg.set("axfr.port", "1");
    EXPECT_EQ(cfg.getIntInRange("axfr.port", 53, 1, 65535), 1);
    EXPECT_EQ(cfg.getIntInRange("absent", 7, 1, 10), 7);
}

TEST_F(ConfigTest, BoolGetterHandlesHighBytes) {
    auto& cfg = Config::instance();
    cfg.set("sni.parallel", "\xC3\x89TRUE");
    EXPECT_FALSE(cfg.getBool("sni.parallel", true));
    cfg.set("sni.parallel", "YES");
    EXPECT_TRUE(cfg.getBool("sni.parallel"));
}
