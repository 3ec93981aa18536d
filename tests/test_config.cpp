#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "config.hpp"
#include "diagnostics.hpp"
#include "test_helpers.hpp"

namespace {

using relay_adapter::AdapterConfig;
using relay_adapter::LogLevel;
using relay_adapter::parse_config;

TEST(ConfigTest, DefaultsMatchDocumentedValues) {
  const AdapterConfig config;
  EXPECT_TRUE(config.config_file_path.empty());
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_TRUE(config.transfer.temp_dir.empty());
  EXPECT_EQ(config.transfer.temp_prefix, "lfscustomdl");
  EXPECT_EQ(config.transfer.chunk_size, 64u * 1024u);
  EXPECT_EQ(config.http.connect_timeout_ms, 30000);
  EXPECT_TRUE(config.http.follow_redirects);
  EXPECT_TRUE(config.http.verify_tls);
}

TEST(ConfigTest, EmptyDocumentGivesDefaults) {
  const AdapterConfig config = parse_config("");
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_EQ(config.transfer.chunk_size, 64u * 1024u);
}

TEST(ConfigTest, ParsesAllSections) {
  test_support::TempDir dir;
  const AdapterConfig config = parse_config(R"(
logging:
  level: debug
transfer:
  temp_dir: )" + dir.path() + R"(
  temp_prefix: relaydl
  chunk_size: 4096
http:
  user_agent: test-agent/1.0
  connect_timeout_ms: 1500
  low_speed_limit_bytes: 10
  low_speed_time_s: 0
  follow_redirects: false
  max_redirects: 3
  verify_tls: false
)");

  EXPECT_EQ(config.log_level, LogLevel::Debug);
  EXPECT_EQ(config.transfer.temp_dir, dir.path());
  EXPECT_EQ(config.transfer.temp_prefix, "relaydl");
  EXPECT_EQ(config.transfer.chunk_size, 4096u);
  EXPECT_EQ(config.http.user_agent, "test-agent/1.0");
  EXPECT_EQ(config.http.connect_timeout_ms, 1500);
  EXPECT_EQ(config.http.low_speed_limit_bytes, 10);
  EXPECT_EQ(config.http.low_speed_time_s, 0);
  EXPECT_FALSE(config.http.follow_redirects);
  EXPECT_EQ(config.http.max_redirects, 3);
  EXPECT_FALSE(config.http.verify_tls);
}

TEST(ConfigTest, RejectsUnknownKeys) {
  EXPECT_THROW(parse_config("unknown_section: 1\n"), std::runtime_error);
  EXPECT_THROW(parse_config("transfer:\n  chunk: 10\n"), std::runtime_error);
}

TEST(ConfigTest, RejectsInvalidValues) {
  EXPECT_THROW(parse_config("logging:\n  level: loud\n"), std::runtime_error);
  EXPECT_THROW(parse_config("transfer:\n  chunk_size: 12\n"), std::runtime_error);
  EXPECT_THROW(parse_config("transfer:\n  chunk_size: lots\n"), std::runtime_error);
  EXPECT_THROW(parse_config("transfer:\n  temp_prefix: a/b\n"), std::runtime_error);
  EXPECT_THROW(parse_config("transfer:\n  temp_dir: /nonexistent/relay/dir\n"),
               std::runtime_error);
  EXPECT_THROW(parse_config("http:\n  connect_timeout_ms: 0\n"), std::runtime_error);
  EXPECT_THROW(parse_config("http:\n  max_redirects: 99\n"), std::runtime_error);
}

TEST(ConfigTest, RejectsNonMapSections) {
  EXPECT_THROW(parse_config("- a\n- b\n"), std::runtime_error);
  EXPECT_THROW(parse_config("http: 3\n"), std::runtime_error);
}

TEST(ConfigTest, InvalidLevelMessageNamesValidValues) {
  try {
    parse_config("logging:\n  level: loud\n");
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find("debug, info, warn, error"),
              std::string::npos);
  }
}

TEST(ConfigTest, LevelNamesParseBack) {
  for (const LogLevel level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                               LogLevel::Error}) {
    EXPECT_EQ(relay_adapter::parse_log_level(relay_adapter::log_level_name(level)),
              level);
  }
}

TEST(ConfigTest, LoadConfigRecordsAbsolutePath) {
  test_support::TempDir dir;
  const std::string path =
      dir.write_file("adapter.yaml", "logging:\n  level: warn\n");

  const AdapterConfig config = relay_adapter::load_config(path);
  EXPECT_EQ(config.log_level, LogLevel::Warn);
  EXPECT_EQ(config.config_file_path, path);
}

TEST(ConfigTest, LoadConfigReportsMissingFile) {
  EXPECT_THROW(relay_adapter::load_config("/nonexistent/relay-adapter.yaml"),
               std::runtime_error);
}

} // namespace
