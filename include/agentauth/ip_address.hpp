/**
 * @file ip_address.hpp
 * @brief IPv4/IPv6 address and CIDR parsing for IP allowlists
 *
 * AgentAuth - Delegated authorization tokens for autonomous agents
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace agentauth {

/**
 * @brief Parsed IP address (IPv4 stored in the first 4 bytes)
 */
struct IpAddress {
    bool is_v6;
    std::array<uint8_t, 16> bytes;
};

/**
 * @brief IP network: address plus prefix length
 *
 * A bare address is a network with a full-length prefix.
 */
struct IpNetwork {
    IpAddress address;
    unsigned prefix_length;
};

/**
 * @brief Parse a textual IPv4 or IPv6 address
 *
 * IPv4-mapped IPv6 addresses (::ffff:a.b.c.d) are normalized to IPv4.
 *
 * @return IpAddress or std::nullopt if invalid
 */
std::optional<IpAddress> parse_ip_address(const std::string& text);

/**
 * @brief Parse "address" or "address/prefix"
 * @return IpNetwork or std::nullopt if invalid or prefix out of range
 */
std::optional<IpNetwork> parse_ip_network(const std::string& text);

/**
 * @brief Check whether address lies inside network (families must match)
 */
bool network_contains(const IpNetwork& network, const IpAddress& address);

} // namespace agentauth
