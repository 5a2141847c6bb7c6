#include <cosign/config/options.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

namespace {

std::optional<cosign::config::options_t> parse(
    std::vector<const char*> args,
    std::string& error) {
  args.insert(std::begin(args), "cosign");
  return cosign::config::parse_options(static_cast<int>(args.size()),
                                       args.data(), error);
}

}  // namespace

TEST(options, defaults_apply_when_only_a_command_is_given) {
  auto error = std::string{};
  auto options = parse({"queue"}, error);
  ASSERT_TRUE(options.has_value()) << error;

  EXPECT_EQ(options->command, "queue");
  EXPECT_TRUE(options->arguments.empty());
  EXPECT_EQ(options->db_path, "cosign.db");
  EXPECT_EQ(options->log_level, "info");
  EXPECT_EQ(options->sync.min_backoff, 1000u);
  EXPECT_EQ(options->sync.max_backoff, 30000u);
  EXPECT_EQ(options->sync.max_retries, 10u);
  EXPECT_EQ(options->session_ttl, 168ull * 60 * 60 * 1000);
  EXPECT_EQ(options->timestamp_policy.max_clock_skew, 300'000u);
  EXPECT_EQ(options->timestamp_policy.max_response_delay, 600'000u);
  EXPECT_FALSE(options->help);
}

TEST(options, flags_and_positional_arguments_are_read) {
  auto error = std::string{};
  auto options = parse({"--db-path", "/tmp/cosign-test", "-l", "debug",
                        "--min-backoff-ms", "250", "--max-backoff-ms", "8000",
                        "--max-retries", "4", "--session-ttl-hours", "2",
                        "--tsa-clock-skew-s", "30", "--tsa-url",
                        "https://tsa.example.com", "tsa-inspect",
                        "response.der", "contract.pdf", "42"},
                       error);
  ASSERT_TRUE(options.has_value()) << error;

  EXPECT_EQ(options->db_path, "/tmp/cosign-test");
  EXPECT_EQ(options->log_level, "debug");
  EXPECT_EQ(options->tsa_url, "https://tsa.example.com");
  EXPECT_EQ(options->sync.min_backoff, 250u);
  EXPECT_EQ(options->sync.max_backoff, 8000u);
  EXPECT_EQ(options->sync.max_retries, 4u);
  EXPECT_EQ(options->session_ttl, 2ull * 60 * 60 * 1000);
  EXPECT_EQ(options->timestamp_policy.max_clock_skew, 30'000u);
  EXPECT_EQ(options->command, "tsa-inspect");
  EXPECT_EQ(options->arguments,
            (std::vector<std::string>{"response.der", "contract.pdf", "42"}));
}

TEST(options, help_needs_no_command) {
  auto error = std::string{};
  auto options = parse({"--help"}, error);
  ASSERT_TRUE(options.has_value()) << error;
  EXPECT_TRUE(options->help);
  EXPECT_NE(options->usage.find("--db-path"), std::string::npos);
}

TEST(options, invalid_settings_are_rejected) {
  auto error = std::string{};
  EXPECT_FALSE(parse({}, error).has_value());
  EXPECT_EQ(error, "missing command");

  EXPECT_FALSE(parse({"-l", "verbose", "queue"}, error).has_value());
  EXPECT_EQ(error, "unknown log level: verbose");

  EXPECT_FALSE(parse({"--min-backoff-ms", "5000", "--max-backoff-ms", "100",
                      "queue"},
                     error)
                   .has_value());
  EXPECT_FALSE(parse({"--min-backoff-ms", "0", "queue"}, error).has_value());
  EXPECT_FALSE(parse({"--session-ttl-hours", "0", "queue"}, error).has_value());
  EXPECT_EQ(error, "session-ttl-hours must be positive");

  error.clear();
  EXPECT_FALSE(parse({"--max-retries", "many", "queue"}, error).has_value());
  EXPECT_FALSE(error.empty());
  error.clear();
  EXPECT_FALSE(parse({"--no-such-flag", "queue"}, error).has_value());
  EXPECT_FALSE(error.empty());
}
