/**
 * @file FieldMapper.hpp
 * @brief Maps status file keys to record fields
 */

#pragma once

#include "models/DiskRecord.hpp"

#include <optional>
#include <string_view>

namespace parser {

/**
 * @brief Look up the record field a key belongs to
 * @param key Key as written in the file (case-sensitive)
 * @return The field, or nullopt for keys the collector does not use
 */
[[nodiscard]] auto map_field(std::string_view key) noexcept -> std::optional<RecordField>;

}  // namespace parser
