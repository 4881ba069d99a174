/**
 * @file MetricEmitter.cpp
 * @brief Gauge emitter implementation
 */

#include "metrics/MetricEmitter.hpp"

#include "util/Logger.hpp"

#include <format>
#include <utility>

namespace metrics {

MetricEmitter::MetricEmitter(std::shared_ptr<IDatagramSink> sink) : sink_(std::move(sink)) {}

auto MetricEmitter::emit_gauge(std::string_view name, int64_t value, const MetricTagSet& tags)
    -> bool {
    if (!sink_) {
        return false;
    }

    const auto line = format_gauge(name, value, tags);
    if (!sink_->send(line)) {
        return false;
    }

    LOG_DEBUG("MetricEmitter", std::format("Sent metric: {}", line));
    return true;
}

auto MetricEmitter::format_gauge(std::string_view name, int64_t value, const MetricTagSet& tags)
    -> std::string {
    if (tags.empty()) {
        return std::format("{}:{}|g", name, value);
    }
    return std::format("{}:{}|g|#{}", name, value, tags.to_string());
}

}  // namespace metrics
