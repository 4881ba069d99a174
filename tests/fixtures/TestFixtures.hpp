/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for disktemp-exporter tests
 */

#pragma once

#include <gtest/gtest.h>

#include "models/DiskRecord.hpp"
#include "parser/RecordValidator.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

/**
 * @brief Fixture owning a scratch directory removed after each test
 */
class TempDirTestFixture : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "disktemp-test-XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr) << "Failed to create temp directory";
        temp_dir = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(temp_dir, ec);
    }

    /**
     * @brief Write a file under the scratch directory
     * @return Full path of the written file
     */
    auto WriteFile(const std::string& name, std::string_view content) -> std::filesystem::path {
        auto path = temp_dir / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

/**
 * @brief Build a RawRecord from field/value pairs
 */
inline auto MakeRawRecord(std::initializer_list<std::pair<RecordField, std::string>> fields)
    -> RawRecord {
    RawRecord raw;
    for (const auto& [field, value] : fields) {
        raw.set(field, value);
    }
    return raw;
}

/**
 * @brief Build a DeviceRecord through the validator; fails the test if rejected
 */
inline auto MakeDeviceRecord(std::initializer_list<std::pair<RecordField, std::string>> fields)
    -> DeviceRecord {
    auto record = parser::RecordValidator::validate(MakeRawRecord(fields));
    EXPECT_TRUE(record.has_value()) << (record ? "" : record.error().message);
    return record.value();
}

/**
 * @brief Status file in the layout written by Unraid's emhttp
 */
constexpr std::string_view SAMPLE_DISKS_INI = R"(["parity"]
idx="0"
name="parity"
device="sdb"
id="WDC_WD80EFAX-68KNBN0_VAGASYWL"
temp="36"
type="Parity"
rotational="1"
transport="ata"
["disk1"]
idx="1"
name="disk1"
device="sdc"
id="ST8000VN004-2M2101_WSD0ZQ4E"
temp="38"
type="Data"
rotational="1"
transport="ata"
["cache"]
idx="30"
name="cache"
device="nvme0n1"
id="Samsung_SSD_970_EVO_Plus_1TB_S4EWNX0R"
temp="41"
type="Cache"
rotational="0"
transport="nvme"
["flash"]
idx="54"
name="flash"
device="sda"
id="SanDisk_Cruzer_Fit"
temp="*"
type="Flash"
rotational="1"
transport="usb"
)";
