#include <gtest/gtest.h>
#include "shardex/config.hpp"
#include "shardex/logger.hpp"
#include "shardex/security_utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace shardex {

namespace {

const char* SAMPLE_CONFIG = R"({
  "engine": {
    "name": "test-engine",
    "shard_count": 2,
    "snapshot_depth": 5,
    "order_pool_size": 1024,
    "lock_timeout_ms": 50
  },
  "risk": {
    "max_order_size": 500
  },
  "logging": {
    "level": "WARN",
    "rate_limit_ms": 0,
    "enable_structured": true
  },
  "symbols": [
    {"symbol": "AAPL", "tick_size": 1, "lot_size": 1, "max_position": 100},
    {"symbol": "ES", "tick_size": 25, "lot_size": 5}
  ]
})";

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("shardex_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
               "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir);
        path = (dir / "shardex.json").string();
        unsetenv("SHARDEX_LOG_LEVEL");
    }

    void TearDown() override {
        std::filesystem::remove_all(dir);
        unsetenv("SHARDEX_LOG_LEVEL");
        Logger::instance().set_level(LogLevel::INFO);
        Logger::instance().enable_structured(false);
    }

    void write(const std::string& file, const std::string& content) {
        std::ofstream out(file, std::ios::binary);
        out << content;
    }

    std::filesystem::path dir;
    std::string path;
};

TEST_F(ConfigTest, ParsesAllSections) {
    auto config = Config::parse(SAMPLE_CONFIG);
    ASSERT_NE(config, nullptr);

    EXPECT_EQ(config->engine.name, "test-engine");
    EXPECT_EQ(config->engine.shard_count, 2u);
    EXPECT_EQ(config->engine.snapshot_depth, 5u);
    EXPECT_EQ(config->engine.order_pool_size, 1024u);
    EXPECT_EQ(config->engine.lock_timeout_ms, 50u);
    EXPECT_EQ(config->risk.max_order_size, 500);
    EXPECT_EQ(config->logging.level, "WARN");
    EXPECT_TRUE(config->logging.enable_structured);

    ASSERT_EQ(config->symbols.size(), 2u);
    EXPECT_EQ(config->symbols[0].symbol, "AAPL");
    EXPECT_EQ(config->symbols[0].max_position, 100);
    EXPECT_EQ(config->symbols[1].symbol, "ES");
    EXPECT_EQ(config->symbols[1].tick_size, 25);
    EXPECT_EQ(config->symbols[1].lot_size, 5);
    EXPECT_EQ(config->symbols[1].max_position, 0);

    EXPECT_TRUE(config->validate());
    ASSERT_NE(config->find_symbol("ES"), nullptr);
    EXPECT_EQ(config->find_symbol("TSLA"), nullptr);
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    auto config = Config::parse(R"({"symbols": [{"symbol": "MSFT"}]})");
    EXPECT_EQ(config->engine.shard_count, 4u);
    EXPECT_EQ(config->engine.lock_timeout_ms, 0u);
    EXPECT_EQ(config->risk.max_order_size, 1'000'000);
    ASSERT_EQ(config->symbols.size(), 1u);
    EXPECT_EQ(config->symbols[0].tick_size, 1);
}

TEST_F(ConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(Config::parse(R"({"engine": {"shard_count": "four"}})"), std::runtime_error);
    EXPECT_THROW(Config::parse(R"({"engine": {"shard_count": -1}})"), std::runtime_error);
    EXPECT_THROW(Config::parse(R"({"logging": {"enable_structured": yes}})"), std::runtime_error);
    EXPECT_THROW(Config::parse(R"({"engine": {"name": "x")"), std::runtime_error);
}

TEST_F(ConfigTest, DefaultsAreValid) {
    auto config = Config::defaults();
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.symbols.size(), 3u);
    EXPECT_NE(config.find_symbol("AAPL"), nullptr);
}

TEST_F(ConfigTest, ValidationFailures) {
    auto config = Config::defaults();
    config.engine.shard_count = 0;
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));

    config = Config::defaults();
    config.symbols.clear();
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));

    config = Config::defaults();
    config.symbols.push_back({"AAPL", 1, 1, 0});
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));

    config = Config::defaults();
    config.symbols.push_back({"bad symbol", 1, 1, 0});
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));

    config = Config::defaults();
    config.symbols[0].tick_size = 0;
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));

    config = Config::defaults();
    config.symbols[0].lot_size = -1;
    EXPECT_TRUE(config.validate().is(ErrorCode::CONFIG_INVALID));
}

TEST_F(ConfigTest, LoadFromFile) {
    write(path, SAMPLE_CONFIG);
    auto config = Config::load_from_file(path);
    ASSERT_NE(config, nullptr);
    EXPECT_EQ(config->engine.name, "test-engine");
}

TEST_F(ConfigTest, MissingFileThrows) {
    EXPECT_THROW(Config::load_from_file((dir / "absent.json").string()), std::runtime_error);

    try {
        Config::load_from_file((dir / "absent.json").string());
        FAIL() << "missing file accepted";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(ErrorCode::FILE_NOT_FOUND));
    }
}

TEST_F(ConfigTest, InvalidFileThrows) {
    write(path, R"({"symbols": []})");
    EXPECT_THROW(Config::load_from_file(path), std::runtime_error);

    try {
        Config::load_from_file(path);
        FAIL() << "invalid file accepted";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(ErrorCode::CONFIG_INVALID));
    }
}

TEST_F(ConfigTest, DigestSidecarVerified) {
    write(path, SAMPLE_CONFIG);
    write(path + ".sha256", SecurityUtils::sha256_hex(SAMPLE_CONFIG) + "  shardex.json\n");
    EXPECT_NO_THROW(Config::load_from_file(path));
}

TEST_F(ConfigTest, TamperedFileRejected) {
    write(path + ".sha256", SecurityUtils::sha256_hex(SAMPLE_CONFIG) + "\n");

    std::string tampered = SAMPLE_CONFIG;
    tampered.replace(tampered.find("500"), 3, "900");
    write(path, tampered);

    EXPECT_THROW(Config::load_from_file(path), std::runtime_error);

    try {
        Config::load_from_file(path);
        FAIL() << "tampered file accepted";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), make_error_code(ErrorCode::CONFIG_INTEGRITY_FAILED));
    }
}

TEST_F(ConfigTest, EnvironmentOverridesLogLevel) {
    write(path, SAMPLE_CONFIG);
    setenv("SHARDEX_LOG_LEVEL", "ERROR", 1);

    auto config = Config::load_from_file(path);
    EXPECT_EQ(config->logging.level, "ERROR");

    config->apply_logging();
    EXPECT_EQ(Logger::instance().level(), LogLevel::ERROR);
}

} // namespace shardex
