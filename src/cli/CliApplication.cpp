/**
 * @file CliApplication.cpp
 * @brief CLI application implementation
 */

#include "cli/CliApplication.hpp"

#include "config.h"
#include "metrics/ConsoleDatagramSink.hpp"
#include "metrics/UdpDatagramSink.hpp"
#include "services/CollectorService.hpp"
#include "util/Logger.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <iostream>
#include <optional>
#include <string_view>
#include <system_error>

#include <getopt.h>

namespace cli {

namespace {

constexpr auto COMPONENT = "CLI";

// Command line options
const struct option long_options[] = {
    {       "help",       no_argument, nullptr, 'h'},
    {    "version",       no_argument, nullptr, 'V'},
    {       "file", required_argument, nullptr, 'f'},
    {       "host", required_argument, nullptr, 'H'},
    {       "port", required_argument, nullptr, 'p'},
    {     "prefix", required_argument, nullptr, 'P'},
    {"strict-tags",       no_argument, nullptr, 's'},
    {    "dry-run",       no_argument, nullptr, 'n'},
    {      "quiet",       no_argument, nullptr, 'q'},
    {    "verbose",       no_argument, nullptr, 'v'},
    {    "log-dir", required_argument, nullptr, 'l'},
    {      nullptr,                 0, nullptr,   0}
};

auto parse_port(std::string_view text) -> std::optional<uint16_t> {
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

}  // namespace

CliApplication::CliApplication() = default;

CliApplication::~CliApplication() = default;

auto CliApplication::run(int argc, char* argv[]) -> int {
    auto options = parse_args(argc, argv);

    if (!options.error.empty()) {
        std::cerr << "Error: " << options.error << "\n\n";
        print_help();
        return 1;
    }

    if (options.show_help) {
        print_help();
        return 0;
    }

    if (options.show_version) {
        print_version();
        return 0;
    }

    const auto& config = options.config;
    setup_logging(config);

    LOG_INFO(COMPONENT, "--- Script execution started. ---");

    CollectorService collector(config.temperature_metric(), metrics::TagBuilder{config.tag_policy},
                               make_sink(config));
    const auto report = collector.run(config.status_file);

    LOG_INFO(COMPONENT, "--- Script execution finished. ---");
    util::Logger::instance().shutdown();

    return report.exit_code();
}

auto CliApplication::parse_args(int argc, char* argv[]) -> CliOptions {
    CliOptions options;

    // Reset getopt state so repeated calls parse from the start
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long(argc, argv, "hVf:H:p:P:snqvl:", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                options.show_help = true;
                break;
            case 'V':
                options.show_version = true;
                break;
            case 'f':
                options.config.status_file = optarg;
                break;
            case 'H':
                options.config.host = optarg;
                break;
            case 'p':
                if (auto port = parse_port(optarg)) {
                    options.config.port = *port;
                } else {
                    options.error = std::format("Invalid port '{}'", optarg);
                }
                break;
            case 'P':
                options.config.metric_prefix = optarg;
                break;
            case 's':
                options.config.tag_policy.replace_hyphens = true;
                break;
            case 'n':
                options.config.dry_run = true;
                break;
            case 'q':
                options.config.log_to_console = false;
                break;
            case 'v':
                options.config.verbose = true;
                break;
            case 'l':
                options.config.log_dir = optarg;
                break;
            default:
                options.error = "Unrecognized or incomplete option";
                break;
        }
    }

    if (options.error.empty() && optind < argc) {
        options.error = std::format("Unexpected argument '{}'", argv[optind]);
    }

    return options;
}

void CliApplication::print_help() {
    std::cout << "Usage: " << APP_NAME << " [OPTIONS]\n\n"
              << "Send disk temperatures from " << DEFAULT_STATUS_FILE
              << " to a DogStatsD agent\n\n"
              << "Options:\n"
              << "  -h, --help              Show this help message\n"
              << "  -V, --version           Show version information\n"
              << "  -f, --file <path>       Disk status file (default: " << DEFAULT_STATUS_FILE
              << ")\n"
              << "  -H, --host <host>       Metrics agent host (default: " << DEFAULT_STATSD_HOST
              << ")\n"
              << "  -p, --port <port>       Metrics agent UDP port (default: "
              << DEFAULT_STATSD_PORT << ")\n"
              << "  -P, --prefix <name>     Metric prefix (default: " << DEFAULT_METRIC_PREFIX
              << ")\n"
              << "  -s, --strict-tags       Also replace '-' in tag values\n"
              << "  -n, --dry-run           Print metric lines instead of sending them\n"
              << "  -q, --quiet             No console logging\n"
              << "  -v, --verbose           Log every metric sent\n"
              << "  -l, --log-dir <dir>     Also log to a rotating file in <dir>\n\n"
              << "Examples:\n"
              << "  " << APP_NAME << "\n"
              << "  " << APP_NAME << " --dry-run --file ./disks.ini\n"
              << "  " << APP_NAME << " --host 10.0.0.5 --port 8125 --quiet\n"
              << std::endl;
}

void CliApplication::print_version() {
    std::cout << APP_NAME << " version " << PROJECT_VERSION << "\n"
              << "Disk temperature exporter for DogStatsD\n";
}

void CliApplication::setup_logging(const CollectorConfig& config) {
    auto& logger = util::Logger::instance();
    logger.set_console_output(config.log_to_console);
    logger.set_min_level(config.verbose ? util::LogLevel::DEBUG : util::LogLevel::INFO);

    if (config.log_dir.empty()) {
        return;
    }
    if (!logger.initialize(config.log_dir, APP_NAME)) {
        LOG_WARNING(COMPONENT, std::format("File logging disabled, cannot write to {}",
                                           config.log_dir.string()));
        return;
    }
    LOG_DEBUG(COMPONENT, std::format("Logging to {}", logger.get_log_file_path().string()));
}

auto CliApplication::make_sink(const CollectorConfig& config) -> std::shared_ptr<IDatagramSink> {
    if (config.dry_run) {
        return std::make_shared<metrics::ConsoleDatagramSink>();
    }

    auto sink = std::make_shared<metrics::UdpDatagramSink>();
    if (auto connected = sink->connect(config.host, config.port); !connected) {
        LOG_ERROR(COMPONENT, connected.error().message);
    }
    return sink;
}

}  // namespace cli
