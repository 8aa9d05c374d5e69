#include <redir/config/config.hpp>
#include <redir/net/http/redirect_client.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

#include "test_support.hpp"

using redir::config::Config;
using redir::config::ConfigError;
using namespace redir::net;
using namespace std::chrono_literals;

namespace {

void expect_config_error(std::string_view toml, std::string_view fragment) {
  try {
    (void)Config::parse(toml);
    FAIL() << "expected ConfigError for: " << toml;
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string{e.what()}.find(fragment), std::string::npos) << e.what();
  }
}

}  // namespace

TEST(ConfigTests, EmptyDocumentKeepsDefaults) {
  Config cfg = Config::parse("");
  EXPECT_EQ(cfg.redirects().max_redirects(), k_default_max_redirects);
  EXPECT_EQ(cfg.redirects().port_match(), PortMatch::literal);
  EXPECT_EQ(cfg.transport().connect_timeout, std::chrono::steady_clock::duration{k_tcp_connect_timeout});
  EXPECT_EQ(cfg.transport().read_timeout, std::chrono::steady_clock::duration{k_http_read_timeout});
  EXPECT_EQ(cfg.transport().user_agent, BOOST_BEAST_VERSION_STRING);
  EXPECT_TRUE(cfg.path().empty());
}

TEST(ConfigTests, ReadsEveryKey) {
  Config cfg = Config::parse(R"(
[redirects]
max = 21
port_match = "default_port_equivalent"

[transport]
connect_timeout_ms = 1500
handshake_timeout_ms = 2500
write_timeout_ms = 3500
read_timeout_ms = 4500
user_agent = "redir-test/1.0"
)");
  EXPECT_EQ(cfg.redirects().max_redirects(), 21u);
  EXPECT_EQ(cfg.redirects().port_match(), PortMatch::default_port_equivalent);
  EXPECT_EQ(cfg.transport().connect_timeout, 1500ms);
  EXPECT_EQ(cfg.transport().handshake_timeout, 2500ms);
  EXPECT_EQ(cfg.transport().write_timeout, 3500ms);
  EXPECT_EQ(cfg.transport().read_timeout, 4500ms);
  EXPECT_EQ(cfg.transport().user_agent, "redir-test/1.0");
}

TEST(ConfigTests, ZeroMaxIsAllowed) {
  EXPECT_EQ(Config::parse("[redirects]\nmax = 0\n").redirects().max_redirects(), 0u);
}

TEST(ConfigTests, RejectsBadValues) {
  expect_config_error("[redirects]\nmax = -1\n", "redirects.max");
  expect_config_error("[redirects]\nmax = \"ten\"\n", "redirects.max");
  expect_config_error("[redirects]\nport_match = \"fuzzy\"\n", "fuzzy");
  expect_config_error("[transport]\nread_timeout_ms = 0\n", "transport.read_timeout_ms");
  expect_config_error("[transport]\nuser_agent = \"\"\n", "transport.user_agent");
}

TEST(ConfigTests, RejectsTimeoutBeyondClockRange) {
  expect_config_error("[transport]\nconnect_timeout_ms = 9223372036854775807\n", "timeout exceeds");
  expect_config_error("[transport]\nread_timeout_ms = 9300000000000\n", "transport.read_timeout_ms");

  Config cfg = Config::parse("[transport]\nwrite_timeout_ms = 9000000000000\n");
  EXPECT_EQ(cfg.transport().write_timeout, std::chrono::milliseconds{9000000000000});
}

TEST(ConfigTests, MalformedTomlIsAConfigError) {
  expect_config_error("[redirects\nmax = 3\n", "TOML parse error");
}

TEST(ConfigTests, LoadFileRecordsAbsolutePath) {
  const auto file = std::filesystem::temp_directory_path() / "redir_config_test.toml";
  {
    std::ofstream out{file};
    out << "[redirects]\nmax = 4\n";
  }
  Config cfg = Config::load_file(file);
  std::filesystem::remove(file);

  EXPECT_EQ(cfg.redirects().max_redirects(), 4u);
  EXPECT_TRUE(cfg.path().is_absolute());
  EXPECT_EQ(cfg.path().filename().string(), "redir_config_test.toml");
}

TEST(ConfigTests, MissingFileIsAConfigError) {
  EXPECT_THROW((void)Config::load_file(std::filesystem::temp_directory_path() / "redir_no_such_file.toml"),
               ConfigError);
  EXPECT_THROW((void)Config::load_file(""), ConfigError);
}

TEST(ConfigTests, PolicyDrivesClient) {
  Config cfg = Config::parse("[redirects]\nmax = 2\n");
  auto transport = std::make_shared<redir::test::ScriptedTransport>(
      [](const WireRequest&) { return redir::test::make_response(boost::beast::http::status::found, "/loop"); });
  Client client{transport, cfg.redirects()};

  boost::asio::io_context ctx;
  (void)redir::test::run(ctx, client.get("http://a.com/"));
  EXPECT_EQ(transport->requests.size(), 3u);
}
