/**
 * @file CollectorService.hpp
 * @brief One read-parse-emit pass over the disk status file
 */

#pragma once

#include "interfaces/IDatagramSink.hpp"
#include "metrics/MetricEmitter.hpp"
#include "metrics/TagBuilder.hpp"
#include "models/DiskRecord.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>

/**
 * @enum RunState
 * @brief Progress of a collection run
 */
enum class RunState {
    AWAITING_FILE,  ///< Not started, or input not yet opened
    PARSING,        ///< Reading sections
    DONE,           ///< Input exhausted and last section processed
    FAILED          ///< Input missing or unreadable
};

/**
 * @struct RunReport
 * @brief Outcome of a collection run
 */
struct RunReport {
    RunState state = RunState::AWAITING_FILE;
    size_t sections_seen = 0;     ///< Section headers found
    size_t records_rejected = 0;  ///< Sections dropped by validation
    size_t metrics_sent = 0;      ///< Gauges handed to the sink
    std::string error_message;    ///< Set when state is FAILED

    /**
     * @brief Process exit code: 0 for a completed pass, 1 otherwise
     */
    [[nodiscard]] auto exit_code() const -> int {
        return state == RunState::DONE ? 0 : 1;
    }
};

/**
 * @class CollectorService
 * @brief Drives parser, validator, tag builder and emitter for one file
 *
 * Each valid section is turned into exactly one temperature gauge, in
 * file order. Invalid sections are logged and skipped.
 */
class CollectorService {
public:
    /**
     * @param metric_name Full gauge name (e.g., "unraid.disk.temperature")
     * @param tag_builder Tag derivation settings
     * @param sink Destination for metric lines
     */
    CollectorService(std::string metric_name, metrics::TagBuilder tag_builder,
                     std::shared_ptr<IDatagramSink> sink);

    /**
     * @brief Open the status file and process it
     * @return Report with state FAILED if the file is missing or unreadable
     */
    auto run(const std::filesystem::path& status_file) -> RunReport;

    /**
     * @brief Process an already opened input
     */
    auto run(std::istream& input) -> RunReport;

    [[nodiscard]] auto state() const -> RunState { return state_; }

private:
    void process_record(const RawRecord& raw, RunReport& report);

    std::string metric_name_;
    metrics::TagBuilder tag_builder_;
    metrics::MetricEmitter emitter_;
    RunState state_ = RunState::AWAITING_FILE;
};
