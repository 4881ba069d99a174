/**
 * @file TagBuilder.hpp
 * @brief Derives canonical metric tags from a device record
 */

#pragma once

#include "metrics/MetricTagSet.hpp"
#include "models/DiskRecord.hpp"

#include <string>
#include <string_view>

namespace metrics {

/**
 * @struct TagPolicy
 * @brief Sanitization options applied to every tag value
 */
struct TagPolicy {
    bool replace_hyphens = false;  ///< Also turn '-' into '_'
};

/**
 * @class TagBuilder
 * @brief Builds the fixed tag list for the temperature gauge
 *
 * Tag order: disk_name, disk_id, disk_type, device, transport and, when
 * the rotational flag is known, drive_kind (hdd or ssd).
 */
class TagBuilder {
public:
    TagBuilder() = default;
    explicit TagBuilder(TagPolicy policy) : policy_(policy) {}

    [[nodiscard]] auto build(const DeviceRecord& record) const -> MetricTagSet;

    /**
     * @brief Lowercase a value and replace wire-format delimiters
     *
     * ',', ':', '|', '#', '@' and whitespace become '_'. Hyphens are
     * replaced only when the policy asks for it.
     */
    [[nodiscard]] static auto sanitize_value(std::string_view value, const TagPolicy& policy)
        -> std::string;

    /**
     * @brief drive_kind value for a rotational state, empty when unknown
     */
    [[nodiscard]] static auto drive_kind(RotationalState state) -> std::string_view;

private:
    TagPolicy policy_;
};

}  // namespace metrics
