/**
 * @file FieldMapper.cpp
 * @brief Key to field lookup
 */

#include "parser/FieldMapper.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace parser {

namespace {

// Superset of the keys written by both disks.ini layouts
constexpr std::array<std::pair<std::string_view, RecordField>, 8> KEY_TABLE{{
    {"name", RecordField::IDENTIFIER},
    {"slot", RecordField::IDENTIFIER},
    {"id", RecordField::SECONDARY_ID},
    {"temp", RecordField::TEMPERATURE},
    {"type", RecordField::TYPE},
    {"device", RecordField::DEVICE_PATH},
    {"transport", RecordField::TRANSPORT},
    {"rotational", RecordField::ROTATIONAL},
}};

}  // namespace

auto map_field(std::string_view key) noexcept -> std::optional<RecordField> {
    const auto* it = std::find_if(KEY_TABLE.begin(), KEY_TABLE.end(),
                                  [key](const auto& entry) { return entry.first == key; });
    if (it == KEY_TABLE.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace parser
