/**
 * @file CliApplication.hpp
 * @brief Command-line entry point for the disk temperature exporter
 */

#pragma once

#include "config/CollectorConfig.hpp"
#include "interfaces/IDatagramSink.hpp"

#include <memory>
#include <string>

namespace cli {

/**
 * @struct CliOptions
 * @brief Parsed command line options
 */
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    std::string error;  ///< Non-empty when the command line was rejected
    CollectorConfig config;
};

/**
 * @class CliApplication
 * @brief Runs one collection pass and maps its outcome to an exit code
 *
 * With no arguments the compiled-in defaults are used, which is how the
 * scheduler normally invokes it.
 */
class CliApplication {
public:
    CliApplication();
    ~CliApplication();

    // Non-copyable
    CliApplication(const CliApplication&) = delete;
    CliApplication& operator=(const CliApplication&) = delete;

    /**
     * @brief Run the CLI application
     * @param argc Argument count
     * @param argv Argument values
     * @return Exit code (0 = pass completed, 1 = input missing or bad usage)
     */
    auto run(int argc, char* argv[]) -> int;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument values
     * @return Parsed options; error is set for invalid input
     */
    [[nodiscard]] static auto parse_args(int argc, char* argv[]) -> CliOptions;

    /**
     * @brief Print help message
     */
    static void print_help();

    /**
     * @brief Print version information
     */
    static void print_version();

private:
    /**
     * @brief Apply logging options to the global logger
     */
    static void setup_logging(const CollectorConfig& config);

    /**
     * @brief Create the sink metric lines are sent to
     *
     * A UDP sink that fails to connect is still returned; its sends report
     * failure and the pass completes without metrics.
     */
    [[nodiscard]] static auto make_sink(const CollectorConfig& config)
        -> std::shared_ptr<IDatagramSink>;
};

}  // namespace cli
