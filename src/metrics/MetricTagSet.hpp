/**
 * @file MetricTagSet.hpp
 * @brief Ordered list of key:value metric tags
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace metrics {

/**
 * @class MetricTagSet
 * @brief Tags in insertion order, rendered as "k1:v1,k2:v2"
 *
 * Does not sanitize; values are expected to come from TagBuilder.
 */
class MetricTagSet {
public:
    using Tag = std::pair<std::string, std::string>;

    void add(std::string key, std::string value) {
        tags_.emplace_back(std::move(key), std::move(value));
    }

    [[nodiscard]] auto tags() const -> const std::vector<Tag>& { return tags_; }
    [[nodiscard]] auto size() const -> size_t { return tags_.size(); }
    [[nodiscard]] auto empty() const -> bool { return tags_.empty(); }

    [[nodiscard]] auto contains(std::string_view key) const -> bool {
        for (const auto& [k, v] : tags_) {
            if (k == key) {
                return true;
            }
        }
        return false;
    }

    /**
     * @brief Value of the first tag with this key, empty if absent
     */
    [[nodiscard]] auto value(std::string_view key) const -> std::string_view {
        for (const auto& [k, v] : tags_) {
            if (k == key) {
                return v;
            }
        }
        return {};
    }

    /**
     * @brief Render as the comma-joined tag list of a gauge line
     */
    [[nodiscard]] auto to_string() const -> std::string {
        std::string out;
        for (const auto& [k, v] : tags_) {
            if (!out.empty()) {
                out += ',';
            }
            out += k;
            out += ':';
            out += v;
        }
        return out;
    }

    auto operator==(const MetricTagSet&) const -> bool = default;

private:
    std::vector<Tag> tags_;
};

}  // namespace metrics
