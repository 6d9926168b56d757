/**
 * @file ip_address.cpp
 * @brief Implementation of IP address and CIDR parsing
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "agentauth/ip_address.hpp"
#include "agentauth/utilities.hpp"

#include <algorithm>
#include <cctype>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <arpa/inet.h>
#endif

namespace agentauth {

std::optional<IpAddress> parse_ip_address(const std::string& text) {
    std::string trimmed = utilities::trim_string(text);
    IpAddress address{};

    in_addr v4{};
    if (inet_pton(AF_INET, trimmed.c_str(), &v4) == 1) {
        address.is_v6 = false;
        const auto* raw = reinterpret_cast<const uint8_t*>(&v4.s_addr);
        std::copy(raw, raw + 4, address.bytes.begin());
        return address;
    }

    in6_addr v6{};
    if (inet_pton(AF_INET6, trimmed.c_str(), &v6) == 1) {
        const auto* raw = reinterpret_cast<const uint8_t*>(&v6);

        // ::ffff:a.b.c.d compares as IPv4
        bool v4_mapped = true;
        for (int i = 0; i < 10; ++i) {
            if (raw[i] != 0) {
                v4_mapped = false;
                break;
            }
        }
        if (v4_mapped && raw[10] == 0xff && raw[11] == 0xff) {
            address.is_v6 = false;
            std::copy(raw + 12, raw + 16, address.bytes.begin());
            return address;
        }

        address.is_v6 = true;
        std::copy(raw, raw + 16, address.bytes.begin());
        return address;
    }

    return std::nullopt;
}

std::optional<IpNetwork> parse_ip_network(const std::string& text) {
    std::string trimmed = utilities::trim_string(text);
    size_t slash = trimmed.find('/');

    auto address = parse_ip_address(trimmed.substr(0, slash));
    if (!address) {
        return std::nullopt;
    }

    unsigned max_prefix = address->is_v6 ? 128 : 32;
    IpNetwork network{*address, max_prefix};

    if (slash == std::string::npos) {
        return network;
    }

    std::string prefix = trimmed.substr(slash + 1);
    if (prefix.empty() || prefix.length() > 3) {
        return std::nullopt;
    }
    for (char c : prefix) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
    }

    unsigned prefix_length = static_cast<unsigned>(std::stoul(prefix));
    if (prefix_length > max_prefix) {
        return std::nullopt;
    }

    network.prefix_length = prefix_length;
    return network;
}

bool network_contains(const IpNetwork& network, const IpAddress& address) {
    if (network.address.is_v6 != address.is_v6) {
        return false;
    }

    unsigned full_bytes = network.prefix_length / 8;
    unsigned remaining_bits = network.prefix_length % 8;

    for (unsigned i = 0; i < full_bytes; ++i) {
        if (network.address.bytes[i] != address.bytes[i]) {
            return false;
        }
    }

    if (remaining_bits > 0) {
        uint8_t mask = static_cast<uint8_t>(0xFF << (8 - remaining_bits));
        if ((network.address.bytes[full_bytes] & mask) != (address.bytes[full_bytes] & mask)) {
            return false;
        }
    }

    return true;
}

} // namespace agentauth
