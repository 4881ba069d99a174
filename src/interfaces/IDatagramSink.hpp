/**
 * @file IDatagramSink.hpp
 * @brief Interface for metric payload delivery
 *
 * A sink receives fully formatted metric lines, one per call, and hands
 * each to its transport as a single unit. Delivery is never confirmed.
 */

#pragma once

#include <string_view>

/**
 * @class IDatagramSink
 * @brief Abstract destination for metric lines
 */
class IDatagramSink {
public:
    virtual ~IDatagramSink() = default;

    /**
     * @brief Hand one payload to the transport
     * @param payload Complete metric line, without trailing newline
     * @return true if the payload was handed off, false if it could not be
     *         sent at all. true does not mean it was received.
     */
    virtual auto send(std::string_view payload) -> bool = 0;
};
