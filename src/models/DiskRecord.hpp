/**
 * @file DiskRecord.hpp
 * @brief Data model for per-disk sections of the status file
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>

/**
 * @enum RecordField
 * @brief Fields recognized inside a disk section
 */
enum class RecordField {
    IDENTIFIER,    ///< Slot name (section label, or name=/slot=)
    SECONDARY_ID,  ///< Device id, usually model and serial
    TEMPERATURE,   ///< Temperature in Celsius, "*" when not reported
    TYPE,          ///< Array role (Data, Parity, Cache, Flash, ...)
    DEVICE_PATH,   ///< Kernel device name (e.g., sdb)
    TRANSPORT,     ///< Bus transport (e.g., ata, usb, nvme)
    ROTATIONAL     ///< "1" for spinning media, "0" for solid state
};

/**
 * @struct RawRecord
 * @brief Accumulator for the key/value lines of one section
 *
 * Holds the last value seen for each recognized field. Values are kept
 * exactly as read (quotes stripped, no other normalization).
 */
struct RawRecord {
    std::map<RecordField, std::string> fields;

    void set(RecordField field, std::string value) {
        fields[field] = std::move(value);
    }

    /**
     * @brief Get a field value
     * @return The value, or an empty string if the field was never set
     */
    [[nodiscard]] auto get(RecordField field) const -> std::string_view {
        if (auto it = fields.find(field); it != fields.end()) {
            return it->second;
        }
        return {};
    }

    [[nodiscard]] auto has(RecordField field) const -> bool {
        return fields.contains(field);
    }

    [[nodiscard]] auto empty() const -> bool {
        return fields.empty();
    }

    auto operator==(const RawRecord&) const -> bool = default;
};

/**
 * @enum RotationalState
 * @brief Media kind as reported by the rotational flag
 */
enum class RotationalState {
    UNKNOWN,       ///< Flag absent or not 0/1
    ROTATING,      ///< Spinning disk
    NON_ROTATING   ///< Solid state
};

namespace parser {
class RecordValidator;
}

/**
 * @class DeviceRecord
 * @brief A validated disk section
 *
 * Only parser::RecordValidator can construct one, so every instance has a
 * non-empty identifier and an integer temperature.
 */
class DeviceRecord {
public:
    [[nodiscard]] auto identifier() const -> const std::string& { return identifier_; }
    [[nodiscard]] auto secondary_id() const -> const std::string& { return secondary_id_; }
    [[nodiscard]] auto temperature() const -> int32_t { return temperature_; }
    [[nodiscard]] auto type() const -> const std::string& { return type_; }
    [[nodiscard]] auto device_path() const -> const std::string& { return device_path_; }
    [[nodiscard]] auto transport() const -> const std::string& { return transport_; }
    [[nodiscard]] auto rotational() const -> RotationalState { return rotational_; }

    auto operator==(const DeviceRecord&) const -> bool = default;

private:
    friend class parser::RecordValidator;

    DeviceRecord() = default;

    std::string identifier_;
    std::string secondary_id_;
    int32_t temperature_ = 0;
    std::string type_;
    std::string device_path_;
    std::string transport_;
    RotationalState rotational_ = RotationalState::UNKNOWN;
};
