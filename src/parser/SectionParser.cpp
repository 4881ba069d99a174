/**
 * @file SectionParser.cpp
 * @brief Section parser implementation
 */

#include "parser/SectionParser.hpp"

#include "parser/FieldMapper.hpp"
#include "util/Logger.hpp"

#include <format>
#include <string>

namespace parser {

namespace {

constexpr auto COMPONENT = "SectionParser";

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

auto is_comment(std::string_view line) noexcept -> bool {
    return !line.empty() && (line.front() == ';' || line.front() == '#');
}

}  // namespace

SectionParser::SectionParser(RecordCallback on_record) : on_record_(std::move(on_record)) {}

void SectionParser::feed_line(std::string_view line) {
    const auto clean = trim(line);
    if (clean.empty() || is_comment(clean)) {
        return;
    }

    if (auto label = parse_section_header(clean)) {
        flush();
        current_ = RawRecord{};
        current_.set(RecordField::IDENTIFIER, std::string{*label});
        section_open_ = true;
        ++sections_seen_;
        return;
    }

    auto pair = parse_key_value(clean);
    if (!pair) {
        return;
    }

    if (!section_open_) {
        LOG_DEBUG(COMPONENT, std::format("Ignoring '{}' outside of any section", pair->first));
        return;
    }

    if (auto field = map_field(pair->first)) {
        current_.set(*field, std::string{pair->second});
    }
}

void SectionParser::finish() {
    flush();
}

void SectionParser::parse(std::istream& input) {
    std::string line;
    while (std::getline(input, line)) {
        feed_line(line);
    }
    finish();
}

void SectionParser::flush() {
    if (!section_open_) {
        return;
    }

    section_open_ = false;
    if (on_record_) {
        on_record_(current_);
    }
    current_ = RawRecord{};
}

auto SectionParser::trim(std::string_view text) noexcept -> std::string_view {
    const auto first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

auto SectionParser::parse_section_header(std::string_view line) noexcept
    -> std::optional<std::string_view> {
    // Shortest header is ["x"]
    if (line.size() < 5 || !line.starts_with("[\"") || !line.ends_with("\"]")) {
        return std::nullopt;
    }
    return line.substr(2, line.size() - 4);
}

auto SectionParser::parse_key_value(std::string_view line) noexcept
    -> std::optional<std::pair<std::string_view, std::string_view>> {
    const auto eq = line.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    const auto key = trim(line.substr(0, eq));
    if (key.empty()) {
        return std::nullopt;
    }

    return std::pair{key, strip_quotes(trim(line.substr(eq + 1)))};
}

auto SectionParser::strip_quotes(std::string_view value) noexcept -> std::string_view {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

}  // namespace parser
