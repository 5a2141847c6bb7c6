#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <cosign/config/options.hpp>
#include <sstream>
#include <string_view>

namespace cosign::config {

namespace {

constexpr auto kLogLevels = std::array<std::string_view, 6>{
    "trace", "debug", "info", "warn", "error", "off"};

}  // namespace

std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       std::string& error) {
  namespace po = boost::program_options;

  auto options = options_t{};
  auto ttl_hours = uint64_t{168};
  auto clock_skew_seconds = uint64_t{300};
  auto response_delay_seconds = uint64_t{600};

  auto description = po::options_description{"Cosign"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", po::value<std::string>(&options.db_path)->default_value(
                       options.db_path),
      "Local RocksDB directory")(
      "tsa-url", po::value<std::string>(&options.tsa_url),
      "RFC 3161 time-stamp authority URL")(
      "log-file", po::value<std::string>(&options.log_file)
                      ->default_value(options.log_file),
      "Log file path")(
      "log-level,l", po::value<std::string>(&options.log_level)
                         ->default_value(options.log_level),
      "trace, debug, info, warn, error or off")(
      "min-backoff-ms", po::value<uint64_t>(&options.sync.min_backoff)
                            ->default_value(options.sync.min_backoff),
      "Delay before the first sync retry")(
      "max-backoff-ms", po::value<uint64_t>(&options.sync.max_backoff)
                            ->default_value(options.sync.max_backoff),
      "Upper bound of the sync retry delay")(
      "max-retries", po::value<uint32_t>(&options.sync.max_retries)
                         ->default_value(options.sync.max_retries),
      "Failed attempts after which a record stalls")(
      "retry-interval-ms", po::value<uint64_t>(&options.sync.retry_interval)
                               ->default_value(options.sync.retry_interval),
      "Period between background drains")(
      "session-ttl-hours",
      po::value<uint64_t>(&ttl_hours)->default_value(ttl_hours),
      "Lifetime of a new session")(
      "tsa-clock-skew-s",
      po::value<uint64_t>(&clock_skew_seconds)
          ->default_value(clock_skew_seconds),
      "Tolerated TSA time before the request")(
      "tsa-response-delay-s",
      po::value<uint64_t>(&response_delay_seconds)
          ->default_value(response_delay_seconds),
      "Tolerated TSA time after the request")(
      "command", po::value<std::string>(&options.command),
      "tsa-request, tsa-inspect, queue, audit or fields")(
      "args", po::value<std::vector<std::string>>(&options.arguments),
      "Command arguments");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  positional.add("args", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return std::nullopt;
  }

  auto usage = std::ostringstream{};
  usage << description;
  options.usage = usage.str();
  options.help = vm.contains("help");

  if (std::ranges::find(kLogLevels, options.log_level) ==
      std::end(kLogLevels)) {
    error = "unknown log level: " + options.log_level;
    return std::nullopt;
  }
  if (options.sync.min_backoff == 0 ||
      options.sync.max_backoff < options.sync.min_backoff) {
    error = "max-backoff-ms must be at least min-backoff-ms, both non-zero";
    return std::nullopt;
  }
  if (ttl_hours == 0) {
    error = "session-ttl-hours must be positive";
    return std::nullopt;
  }
  options.session_ttl = ttl_hours * 60 * 60 * 1000;
  options.timestamp_policy.max_clock_skew = clock_skew_seconds * 1000;
  options.timestamp_policy.max_response_delay = response_delay_seconds * 1000;
  if (!options.help && options.command.empty()) {
    error = "missing command";
    return std::nullopt;
  }
  return options;
}

}  // namespace cosign::config
