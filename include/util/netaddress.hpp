#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Parse "IP/prefix-length" strings reported by address discovery
 - Classify addresses by scope (loopback, link-local, private, routable)

 Key functions:
 - ParseIPAddress: Parse and normalize (IPv4-mapped -> IPv4)
 - ValidateAndNormalizeIP: Canonical string form of an address
 - ParseIPPrefix: Parse "1.2.3.4/24" / "2001:db8::1/64"
 - IsLinkLocal / IsPrivate / IsGloballyRoutable: scope checks
*/

#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace nodeguard {
namespace util {

/**
 * Address with its on-link prefix length, as reported by the host
 * (e.g. 192.168.0.1/24). The host bits are kept.
 */
struct IPPrefix {
  boost::asio::ip::address address;
  uint8_t prefix_length{0};

  std::string ToString() const;
};

/**
 * Parse and normalize an IP address string
 *
 * 1. Validates that the string is a valid IP address (IPv4 or IPv6)
 * 2. Normalizes IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4)
 *
 * Without the normalization "1.2.3.4" and "::ffff:1.2.3.4" would compare
 * unequal, which lets a certificate request claim an address the node holds
 * under a different spelling.
 *
 * Rejects empty strings, hostnames and anything with a zone suffix.
 *
 * @return Parsed address, or std::nullopt if invalid
 */
std::optional<boost::asio::ip::address> ParseIPAddress(const std::string& address);

/**
 * Normalize an already-parsed address (IPv4-mapped -> IPv4)
 */
boost::asio::ip::address NormalizeIP(const boost::asio::ip::address& address);

/**
 * Validate and normalize an IP address string
 *
 * @param address IP address string to validate and normalize
 * @return Canonical string form, or std::nullopt if invalid
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:DB8:0::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

/**
 * Check if a string is a valid IP address
 */
bool IsValidIPAddress(const std::string& address);

/**
 * Parse "IP/len" string
 *
 * A missing "/len" means a host prefix (/32 or /128). The length must fit
 * the family of the (normalized) address; an IPv4-mapped address with a
 * length above 32 has the 96-bit mapping prefix removed.
 *
 * @return Parsed prefix, or std::nullopt if invalid
 */
std::optional<IPPrefix> ParseIPPrefix(const std::string& prefix);

// 169.254.0.0/16 and fe80::/10
bool IsLinkLocal(const boost::asio::ip::address& address);

// RFC 1918, 100.64.0.0/10 shared address space, and fc00::/7 unique-local
bool IsPrivate(const boost::asio::ip::address& address);

/**
 * True for unicast addresses that may be reachable beyond the local host
 * and segment: not unspecified, loopback, link-local, multicast or the
 * IPv4 limited broadcast address. Private ranges count as routable here.
 */
bool IsGlobalUnicast(const boost::asio::ip::address& address);

} // namespace util
} // namespace nodeguard
