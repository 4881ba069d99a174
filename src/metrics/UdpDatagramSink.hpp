/**
 * @file UdpDatagramSink.hpp
 * @brief Fire-and-forget UDP delivery of metric lines
 */

#pragma once

#include "interfaces/IDatagramSink.hpp"
#include "util/Error.hpp"

#include <gio/gio.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace metrics {

/**
 * @class UdpDatagramSink
 * @brief Sends each payload as one UDP datagram to a fixed destination
 *
 * The host is resolved once in connect(), preferring an IPv4 address
 * when the name has several. Nothing is retried and nothing is read back.
 */
class UdpDatagramSink : public IDatagramSink {
public:
    UdpDatagramSink();
    ~UdpDatagramSink() override;

    // Prevent copying
    UdpDatagramSink(const UdpDatagramSink&) = delete;
    UdpDatagramSink& operator=(const UdpDatagramSink&) = delete;
    UdpDatagramSink(UdpDatagramSink&&) = delete;
    UdpDatagramSink& operator=(UdpDatagramSink&&) = delete;

    /**
     * @brief Resolve the destination and open the datagram socket
     * @param host Host name or address literal
     * @param port Destination UDP port
     */
    auto connect(const std::string& host, uint16_t port) -> std::expected<void, util::Error>;

    [[nodiscard]] auto is_connected() const -> bool;

    /**
     * @brief Send one datagram
     * @return false if not connected or the kernel refused the send
     */
    auto send(std::string_view payload) -> bool override;

private:
    void cleanup();

    GSocket* socket_ = nullptr;
    GSocketAddress* destination_ = nullptr;
};

}  // namespace metrics
