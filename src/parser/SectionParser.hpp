/**
 * @file SectionParser.hpp
 * @brief Streaming parser for the sectioned disk status file
 *
 * The status file is a sequence of blocks:
 * @code
 * ["disk1"]
 * id="WDC_WD80EFAX-68KNBN0_VAGASYWL"
 * temp="38"
 * type="Data"
 * rotational="1"
 * @endcode
 *
 * Each block header closes the previous block. The last block has no
 * header after it, so callers must call finish() once the input is
 * exhausted.
 */

#pragma once

#include "models/DiskRecord.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace parser {

/**
 * @brief Callback invoked once per completed section
 */
using RecordCallback = std::function<void(const RawRecord&)>;

/**
 * @class SectionParser
 * @brief Line-driven state machine turning sections into RawRecords
 *
 * Owns the single in-progress RawRecord. Records are delivered in file
 * order through the callback given at construction.
 */
class SectionParser {
public:
    explicit SectionParser(RecordCallback on_record);

    /**
     * @brief Process one line of input
     *
     * Section headers flush the open section and start a new one seeded
     * with the header label as identifier. Key/value lines update the
     * open section. Anything else, and any key/value line before the first
     * header, is ignored.
     */
    void feed_line(std::string_view line);

    /**
     * @brief Flush the open section, if any
     *
     * Must be called exactly once after the last line. A second call
     * emits nothing.
     */
    void finish();

    /**
     * @brief Feed every line of a stream, then finish()
     */
    void parse(std::istream& input);

    /**
     * @brief Number of section headers seen so far
     */
    [[nodiscard]] auto sections_seen() const noexcept -> size_t { return sections_seen_; }

    /**
     * @brief Strip leading and trailing whitespace
     */
    [[nodiscard]] static auto trim(std::string_view text) noexcept -> std::string_view;

    /**
     * @brief Extract the label of a `["label"]` header line
     * @param line Trimmed line
     * @return The label, or nullopt if the line is not a header
     */
    [[nodiscard]] static auto parse_section_header(std::string_view line) noexcept
        -> std::optional<std::string_view>;

    /**
     * @brief Split a `key=value` line at the first '='
     * @param line Trimmed line
     * @return Trimmed key and value with enclosing double quotes removed,
     *         or nullopt if the line has no '=' or an empty key
     */
    [[nodiscard]] static auto parse_key_value(std::string_view line) noexcept
        -> std::optional<std::pair<std::string_view, std::string_view>>;

    /**
     * @brief Remove one pair of enclosing double quotes
     */
    [[nodiscard]] static auto strip_quotes(std::string_view value) noexcept -> std::string_view;

private:
    void flush();

    RecordCallback on_record_;
    RawRecord current_;
    bool section_open_ = false;
    size_t sections_seen_ = 0;
};

}  // namespace parser
