/**
 * @file UdpDatagramSink.cpp
 * @brief UDP sink implementation on top of GIO sockets
 */

#include "metrics/UdpDatagramSink.hpp"

#include "util/Logger.hpp"

#include <format>
#include <utility>

namespace metrics {

namespace {

constexpr auto COMPONENT = "UdpSink";

}  // namespace

UdpDatagramSink::UdpDatagramSink() = default;

UdpDatagramSink::~UdpDatagramSink() {
    cleanup();
}

void UdpDatagramSink::cleanup() {
    if (socket_) {
        g_socket_close(socket_, nullptr);
        g_object_unref(socket_);
        socket_ = nullptr;
    }

    if (destination_) {
        g_object_unref(destination_);
        destination_ = nullptr;
    }
}

auto UdpDatagramSink::connect(const std::string& host, uint16_t port)
    -> std::expected<void, util::Error> {
    cleanup();

    if (host.empty()) {
        return util::fail("Metrics host is empty");
    }

    GError* error = nullptr;

    GResolver* resolver = g_resolver_get_default();
    GList* addresses = g_resolver_lookup_by_name(resolver, host.c_str(), nullptr, &error);
    g_object_unref(resolver);

    if (!addresses) {
        auto message = std::format("Failed to resolve {}: {}", host,
                                   error ? error->message : "unknown");
        g_clear_error(&error);
        return util::fail(std::move(message));
    }

    GInetAddress* chosen = G_INET_ADDRESS(addresses->data);
    for (GList* item = addresses; item != nullptr; item = item->next) {
        auto* candidate = G_INET_ADDRESS(item->data);
        if (g_inet_address_get_family(candidate) == G_SOCKET_FAMILY_IPV4) {
            chosen = candidate;
            break;
        }
    }

    // The socket address keeps its own reference to the chosen address
    destination_ = g_inet_socket_address_new(chosen, port);
    const GSocketFamily family = g_inet_address_get_family(chosen);
    g_resolver_free_addresses(addresses);

    socket_ = g_socket_new(family, G_SOCKET_TYPE_DATAGRAM, G_SOCKET_PROTOCOL_UDP, &error);
    if (!socket_) {
        auto message = std::format("Failed to create UDP socket: {}",
                                   error ? error->message : "unknown");
        g_clear_error(&error);
        cleanup();
        return util::fail(std::move(message));
    }

    LOG_DEBUG(COMPONENT, std::format("Sending metrics to {}:{}", host, port));
    return {};
}

auto UdpDatagramSink::is_connected() const -> bool {
    return socket_ != nullptr && destination_ != nullptr;
}

auto UdpDatagramSink::send(std::string_view payload) -> bool {
    if (!is_connected()) {
        return false;
    }

    GError* error = nullptr;
    const gssize sent =
        g_socket_send_to(socket_, destination_, payload.data(), payload.size(), nullptr, &error);

    if (sent < 0) {
        LOG_WARNING(COMPONENT, std::format("Datagram not sent: {}",
                                           error ? error->message : "unknown"));
        g_clear_error(&error);
        return false;
    }

    return true;
}

}  // namespace metrics
