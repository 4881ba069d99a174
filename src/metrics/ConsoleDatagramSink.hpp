/**
 * @file ConsoleDatagramSink.hpp
 * @brief Dry-run sink printing metric lines instead of sending them
 */

#pragma once

#include "interfaces/IDatagramSink.hpp"

#include <iostream>
#include <ostream>
#include <string_view>

namespace metrics {

/**
 * @class ConsoleDatagramSink
 * @brief Writes each payload as one line to a stream (stdout by default)
 */
class ConsoleDatagramSink : public IDatagramSink {
public:
    explicit ConsoleDatagramSink(std::ostream& out = std::cout) : out_(out) {}

    auto send(std::string_view payload) -> bool override {
        out_ << payload << '\n';
        out_.flush();
        return static_cast<bool>(out_);
    }

private:
    std::ostream& out_;
};

}  // namespace metrics
