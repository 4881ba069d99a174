/**
 * @file CollectorService.cpp
 * @brief Collection run implementation
 */

#include "services/CollectorService.hpp"

#include "parser/RecordValidator.hpp"
#include "parser/SectionParser.hpp"
#include "util/Logger.hpp"

#include <format>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "Collector";
}  // namespace

CollectorService::CollectorService(std::string metric_name, metrics::TagBuilder tag_builder,
                                   std::shared_ptr<IDatagramSink> sink)
    : metric_name_(std::move(metric_name)),
      tag_builder_(tag_builder),
      emitter_(std::move(sink)) {}

auto CollectorService::run(const fs::path& status_file) -> RunReport {
    state_ = RunState::AWAITING_FILE;

    std::error_code ec;
    if (!fs::is_regular_file(status_file, ec)) {
        state_ = RunState::FAILED;
        RunReport report;
        report.state = state_;
        report.error_message = std::format("{} not found", status_file.string());
        LOG_ERROR(COMPONENT, std::format("{}. Exiting.", report.error_message));
        return report;
    }

    std::ifstream input(status_file);
    if (!input.is_open()) {
        state_ = RunState::FAILED;
        RunReport report;
        report.state = state_;
        report.error_message = std::format("Cannot open {}", status_file.string());
        LOG_ERROR(COMPONENT, std::format("{}. Exiting.", report.error_message));
        return report;
    }

    LOG_INFO(COMPONENT,
             std::format("Found disk info file, starting parsing: {}", status_file.string()));
    return run(input);
}

auto CollectorService::run(std::istream& input) -> RunReport {
    RunReport report;
    state_ = RunState::PARSING;

    parser::SectionParser section_parser(
        [this, &report](const RawRecord& raw) { process_record(raw, report); });
    section_parser.parse(input);

    report.sections_seen = section_parser.sections_seen();

    if (input.bad()) {
        state_ = RunState::FAILED;
        report.state = state_;
        report.error_message = "Read error while parsing input";
        LOG_ERROR(COMPONENT, report.error_message);
        return report;
    }

    state_ = RunState::DONE;
    report.state = state_;

    LOG_INFO(COMPONENT,
             std::format("Processed and sent metrics for {} disks", report.metrics_sent));
    if (report.records_rejected > 0) {
        LOG_INFO(COMPONENT, std::format("Skipped {} of {} sections", report.records_rejected,
                                        report.sections_seen));
    }
    return report;
}

void CollectorService::process_record(const RawRecord& raw, RunReport& report) {
    auto record = parser::RecordValidator::validate(raw);
    if (!record) {
        ++report.records_rejected;
        const auto reason = static_cast<parser::RejectReason>(record.error().code);
        LOG_WARNING(COMPONENT, std::format("{} [{}]", record.error().message,
                                           parser::reject_reason_to_string(reason)));
        return;
    }

    LOG_INFO(COMPONENT, std::format("Processing: Slot='{}', ID='{}', Type='{}', Temp='{}'",
                                    record->identifier(), record->secondary_id(), record->type(),
                                    record->temperature()));

    const auto tags = tag_builder_.build(*record);
    if (emitter_.emit_gauge(metric_name_, record->temperature(), tags)) {
        ++report.metrics_sent;
    } else {
        LOG_WARNING(COMPONENT,
                    std::format("Metric for disk '{}' was not sent", record->identifier()));
    }
}
