/**
 * @file RecordValidator.hpp
 * @brief Turns raw sections into validated device records
 */

#pragma once

#include "models/DiskRecord.hpp"
#include "util/Error.hpp"

#include <expected>
#include <string_view>

namespace parser {

/**
 * @enum RejectReason
 * @brief Why a section did not produce a DeviceRecord
 *
 * The numeric value is used as util::Error::code.
 */
enum class RejectReason {
    MISSING_IDENTIFIER = 1,
    MISSING_TEMPERATURE,
    NON_NUMERIC_TEMPERATURE,
    TEMPERATURE_OUT_OF_RANGE
};

/**
 * @brief Short human-readable description of a reject reason
 */
[[nodiscard]] auto reject_reason_to_string(RejectReason reason) noexcept -> std::string_view;

/**
 * @class RecordValidator
 * @brief The only producer of DeviceRecord
 *
 * Checks, in order: identifier present, temperature present, temperature
 * all digits, temperature fits in 32 bits. The first failing check
 * decides the rejection.
 */
class RecordValidator {
public:
    /**
     * @brief Validate a section
     * @param raw Section as read by SectionParser
     * @return DeviceRecord, or an Error whose code is a RejectReason
     */
    [[nodiscard]] static auto validate(const RawRecord& raw)
        -> std::expected<DeviceRecord, util::Error>;

    /**
     * @brief Check that a value is non-empty and made only of ASCII digits
     */
    [[nodiscard]] static auto is_all_digits(std::string_view value) noexcept -> bool;

    /**
     * @brief Map the rotational flag: "1" rotating, "0" non-rotating, else unknown
     */
    [[nodiscard]] static auto parse_rotational(std::string_view value) noexcept
        -> RotationalState;
};

}  // namespace parser
