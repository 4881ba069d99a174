/**
 * @file RecordValidator.cpp
 * @brief Record validation implementation
 */

#include "parser/RecordValidator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

namespace parser {

namespace {

auto reject(RejectReason reason, std::string message) -> std::unexpected<util::Error> {
    return util::fail(std::move(message), static_cast<int>(reason));
}

}  // namespace

auto reject_reason_to_string(RejectReason reason) noexcept -> std::string_view {
    switch (reason) {
        case RejectReason::MISSING_IDENTIFIER:
            return "missing identifier";
        case RejectReason::MISSING_TEMPERATURE:
            return "missing temperature";
        case RejectReason::NON_NUMERIC_TEMPERATURE:
            return "temperature is not a valid number";
        case RejectReason::TEMPERATURE_OUT_OF_RANGE:
            return "temperature out of range";
    }
    return "unknown";
}

auto RecordValidator::validate(const RawRecord& raw) -> std::expected<DeviceRecord, util::Error> {
    const auto identifier = raw.get(RecordField::IDENTIFIER);
    if (identifier.empty()) {
        return reject(RejectReason::MISSING_IDENTIFIER, "Section has no identifier");
    }

    const auto temp = raw.get(RecordField::TEMPERATURE);
    if (temp.empty()) {
        return reject(RejectReason::MISSING_TEMPERATURE,
                      std::format("Skipping disk '{}': no temperature reported", identifier));
    }

    if (!is_all_digits(temp)) {
        return reject(RejectReason::NON_NUMERIC_TEMPERATURE,
                      std::format("Skipping disk '{}' because temperature ('{}') is not a "
                                  "valid number",
                                  identifier, temp));
    }

    int32_t celsius = 0;
    const auto [ptr, ec] = std::from_chars(temp.data(), temp.data() + temp.size(), celsius);
    if (ec != std::errc{} || ptr != temp.data() + temp.size()) {
        return reject(RejectReason::TEMPERATURE_OUT_OF_RANGE,
                      std::format("Skipping disk '{}' because temperature ('{}') is out of range",
                                  identifier, temp));
    }

    DeviceRecord record;
    record.identifier_ = std::string{identifier};
    record.secondary_id_ = std::string{raw.get(RecordField::SECONDARY_ID)};
    record.temperature_ = celsius;
    record.type_ = std::string{raw.get(RecordField::TYPE)};
    record.device_path_ = std::string{raw.get(RecordField::DEVICE_PATH)};
    record.transport_ = std::string{raw.get(RecordField::TRANSPORT)};
    record.rotational_ = parse_rotational(raw.get(RecordField::ROTATIONAL));
    return record;
}

auto RecordValidator::is_all_digits(std::string_view value) noexcept -> bool {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
}

auto RecordValidator::parse_rotational(std::string_view value) noexcept -> RotationalState {
    if (value == "1") {
        return RotationalState::ROTATING;
    }
    if (value == "0") {
        return RotationalState::NON_ROTATING;
    }
    return RotationalState::UNKNOWN;
}

}  // namespace parser
