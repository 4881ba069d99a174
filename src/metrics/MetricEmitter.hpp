/**
 * @file MetricEmitter.hpp
 * @brief DogStatsD gauge formatting and emission
 */

#pragma once

#include "interfaces/IDatagramSink.hpp"
#include "metrics/MetricTagSet.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace metrics {

/**
 * @class MetricEmitter
 * @brief Formats gauge lines and hands them to a datagram sink
 *
 * Line format: `name:value|g|#tag1,tag2`, no trailing newline. One call
 * produces exactly one payload.
 */
class MetricEmitter {
public:
    explicit MetricEmitter(std::shared_ptr<IDatagramSink> sink);

    /**
     * @brief Format and send one gauge sample
     * @return true if the sink accepted the payload
     */
    auto emit_gauge(std::string_view name, int64_t value, const MetricTagSet& tags) -> bool;

    /**
     * @brief Build a gauge line; the "|#" section is omitted for no tags
     */
    [[nodiscard]] static auto format_gauge(std::string_view name, int64_t value,
                                           const MetricTagSet& tags) -> std::string;

private:
    std::shared_ptr<IDatagramSink> sink_;
};

}  // namespace metrics
