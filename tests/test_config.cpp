#include "file_server.hpp"
#include "test_util.hpp"

using json = nlohmann::json;

TEST(ServerConfig, Defaults) {
  ServerConfig cfg;
  EXPECT_EQ(cfg.listen.ip, "127.0.0.1");
  EXPECT_EQ(cfg.listen.port, 8089);
  EXPECT_EQ(cfg.max_connections, 10);
  EXPECT_EQ(cfg.stats_interval_ms, 1000);
  EXPECT_EQ(cfg.admission_backoff_ms, 6000);
  EXPECT_EQ(cfg.chunk_bytes, 1024u);
  EXPECT_EQ(cfg.client_read_timeout_ms, 0);
  EXPECT_FALSE(cfg.upload_is_fatal);
  EXPECT_FALSE(cfg.stats_holds_slot);
  EXPECT_NO_THROW(cfg.validate());
}

TEST(ServerConfig, JsonOverridesOnlyGivenKeys) {
  ServerConfig cfg = config_from_json(json{
    {"listen_port", 9100},
    {"max_connections", 3},
    {"root_name", "served"},
    {"stats_holds_slot", true},
  });
  EXPECT_EQ(cfg.listen.port, 9100);
  EXPECT_EQ(cfg.max_connections, 3);
  EXPECT_EQ(cfg.root_name, "served");
  EXPECT_TRUE(cfg.stats_holds_slot);
  EXPECT_EQ(cfg.listen.ip, "127.0.0.1");
  EXPECT_EQ(cfg.stats_interval_ms, 1000);
}

TEST(ServerConfig, ValidateRejectsBadValues) {
  ServerConfig cfg;
  cfg.max_connections = 0;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = ServerConfig{};
  cfg.chunk_bytes = 0;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg = ServerConfig{};
  cfg.stats_interval_ms = -5;
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(ServerConfig, LoadsFile) {
  const auto path = scratch_base() / "config_loads_file.json";
  write_file(path, R"({"listen_ip": "0.0.0.0", "admission_backoff_ms": 250})");
  ServerConfig cfg = load_config(path.string());
  EXPECT_EQ(cfg.listen.ip, "0.0.0.0");
  EXPECT_EQ(cfg.admission_backoff_ms, 250);
  std::filesystem::remove(path);
}

TEST(ServerConfigDeathTest, MissingOrMalformedFileIsFatal) {
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  EXPECT_EXIT(load_config("/nonexistent/fileserve.json"), ::testing::ExitedWithCode(1), "cannot open");

  const auto path = scratch_base() / "config_malformed.json";
  write_file(path, "{ not json");
  EXPECT_EXIT(load_config(path.string()), ::testing::ExitedWithCode(1), "bad config");
  std::filesystem::remove(path);
}
