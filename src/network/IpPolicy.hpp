#pragma once
#include <functional>
#include <string>
#include <boost/asio/ip/address.hpp>

namespace ReadServe {
namespace IpPolicy {

// Predicate deciding whether a resolved address may be dialed. Injected into the transport.
using Predicate = std::function<bool(const boost::asio::ip::address&)>;

// True for loopback, RFC1918 / ULA private ranges, link-local unicast and multicast,
// and the unspecified address. IPv4-mapped IPv6 addresses are judged by their IPv4 part.
bool IsForbidden(const boost::asio::ip::address& addr);

// String form; anything that does not parse as an IP address is forbidden.
bool IsForbidden(const std::string& ip);

}
}
