/**
 * @file TagBuilder.cpp
 * @brief Tag derivation and sanitization
 */

#include "metrics/TagBuilder.hpp"

#include <cctype>

namespace metrics {

namespace {

auto is_delimiter(char c) noexcept -> bool {
    switch (c) {
        case ',':
        case ':':
        case '|':
        case '#':
        case '@':
            return true;
        default:
            return std::isspace(static_cast<unsigned char>(c)) != 0;
    }
}

}  // namespace

auto TagBuilder::build(const DeviceRecord& record) const -> MetricTagSet {
    MetricTagSet tags;
    tags.add("disk_name", sanitize_value(record.identifier(), policy_));
    tags.add("disk_id", sanitize_value(record.secondary_id(), policy_));
    tags.add("disk_type", sanitize_value(record.type(), policy_));
    tags.add("device", sanitize_value(record.device_path(), policy_));
    tags.add("transport", sanitize_value(record.transport(), policy_));

    if (auto kind = drive_kind(record.rotational()); !kind.empty()) {
        tags.add("drive_kind", std::string{kind});
    }

    return tags;
}

auto TagBuilder::sanitize_value(std::string_view value, const TagPolicy& policy) -> std::string {
    std::string out;
    out.reserve(value.size());

    for (char c : value) {
        if (is_delimiter(c) || (policy.replace_hyphens && c == '-')) {
            out += '_';
        } else {
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }

    return out;
}

auto TagBuilder::drive_kind(RotationalState state) -> std::string_view {
    switch (state) {
        case RotationalState::ROTATING:
            return "hdd";
        case RotationalState::NON_ROTATING:
            return "ssd";
        case RotationalState::UNKNOWN:
            return {};
    }
    return {};
}

}  // namespace metrics
