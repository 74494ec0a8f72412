#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"
#include "util/logging.hpp"

namespace nodeguard {
namespace util {

namespace {

constexpr uint8_t kMaxPrefixV4 = 32;
constexpr uint8_t kMaxPrefixV6 = 128;
constexpr uint8_t kV4MappedPrefix = 96;

} // namespace

std::string IPPrefix::ToString() const {
  return address.to_string() + "/" + std::to_string(prefix_length);
}

boost::asio::ip::address NormalizeIP(const boost::asio::ip::address& address) {
  if (address.is_v6() && address.to_v6().is_v4_mapped()) {
    return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, address.to_v6());
  }
  return address;
}

std::optional<boost::asio::ip::address> ParseIPAddress(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  // Scoped addresses ("fe80::1%eth0") never identify a node
  if (address.find('%') != std::string::npos) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }
    return NormalizeIP(ip);
  } catch (const std::exception& e) {
    LOG_TRACE("ParseIPAddress: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  auto ip = ParseIPAddress(address);
  if (!ip) {
    return std::nullopt;
  }
  return ip->to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ParseIPAddress(address).has_value();
}

std::optional<IPPrefix> ParseIPPrefix(const std::string& prefix) {
  const size_t slash = prefix.find('/');
  const std::string addr_part = prefix.substr(0, slash);

  // Parse without normalizing first: the prefix length of a mapped address
  // is expressed in IPv6 bits
  if (addr_part.empty() || addr_part.find('%') != std::string::npos) {
    return std::nullopt;
  }
  boost::system::error_code ec;
  auto raw = boost::asio::ip::make_address(addr_part, ec);
  if (ec) {
    return std::nullopt;
  }

  const uint8_t max_len = raw.is_v4() ? kMaxPrefixV4 : kMaxPrefixV6;
  int length = max_len;
  if (slash != std::string::npos) {
    auto parsed = SafeParseInt(prefix.substr(slash + 1), 0, max_len);
    if (!parsed) {
      return std::nullopt;
    }
    length = *parsed;
  }

  IPPrefix result;
  result.address = NormalizeIP(raw);
  if (raw.is_v6() && result.address.is_v4()) {
    if (length < kV4MappedPrefix) {
      return std::nullopt;
    }
    length -= kV4MappedPrefix;
  }
  result.prefix_length = static_cast<uint8_t>(length);
  return result;
}

bool IsLinkLocal(const boost::asio::ip::address& address) {
  if (address.is_v4()) {
    auto bytes = address.to_v4().to_bytes();
    return bytes[0] == 169 && bytes[1] == 254;
  }
  return address.to_v6().is_link_local();
}

bool IsPrivate(const boost::asio::ip::address& address) {
  if (address.is_v4()) {
    auto b = address.to_v4().to_bytes();
    return b[0] == 10 ||
           (b[0] == 172 && (b[1] & 0xf0) == 16) ||
           (b[0] == 192 && b[1] == 168) ||
           (b[0] == 100 && (b[1] & 0xc0) == 64);
  }
  auto b = address.to_v6().to_bytes();
  return (b[0] & 0xfe) == 0xfc;
}

bool IsGlobalUnicast(const boost::asio::ip::address& address) {
  if (address.is_unspecified() || address.is_loopback() || address.is_multicast() ||
      IsLinkLocal(address)) {
    return false;
  }
  if (address.is_v4()) {
    return address.to_v4() != boost::asio::ip::address_v4::broadcast();
  }
  return true;
}

} // namespace util
} // namespace nodeguard
