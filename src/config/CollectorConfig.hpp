/**
 * @file CollectorConfig.hpp
 * @brief Effective configuration of one collection run
 */

#pragma once

#include "config.h"
#include "metrics/TagBuilder.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

/**
 * @struct CollectorConfig
 * @brief Run settings; defaults come from the build configuration
 */
struct CollectorConfig {
    std::filesystem::path status_file = DEFAULT_STATUS_FILE;  ///< disks.ini to read
    std::string host = DEFAULT_STATSD_HOST;                   ///< Metrics agent host
    uint16_t port = DEFAULT_STATSD_PORT;                      ///< Metrics agent UDP port
    std::string metric_prefix = DEFAULT_METRIC_PREFIX;        ///< Prepended to metric names
    metrics::TagPolicy tag_policy;                            ///< Tag sanitization options
    bool dry_run = false;         ///< Print metric lines instead of sending them
    bool log_to_console = true;   ///< Diagnostic output on stderr
    bool verbose = false;         ///< Log at DEBUG level
    std::filesystem::path log_dir;  ///< Also log to a file here when set

    /**
     * @brief Full name of the temperature gauge
     */
    [[nodiscard]] auto temperature_metric() const -> std::string {
        return metric_prefix + ".temperature";
    }
};
