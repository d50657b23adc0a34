#include "IpPolicy.hpp"

namespace {

bool IsForbiddenV4(const boost::asio::ip::address_v4::bytes_type& b) {
    // 0.0.0.0
    if (b[0] == 0 && b[1] == 0 && b[2] == 0 && b[3] == 0) return true;
    // 127.0.0.0/8
    if (b[0] == 127) return true;
    // 10.0.0.0/8
    if (b[0] == 10) return true;
    // 172.16.0.0/12
    if (b[0] == 172 && (b[1] & 0xF0) == 16) return true;
    // 192.168.0.0/16
    if (b[0] == 192 && b[1] == 168) return true;
    // 169.254.0.0/16 link-local unicast
    if (b[0] == 169 && b[1] == 254) return true;
    // 224.0.0.0/24 link-local multicast
    if (b[0] == 224 && b[1] == 0 && b[2] == 0) return true;
    return false;
}

bool IsForbiddenV6(const boost::asio::ip::address_v6& v6) {
    if (v6.is_v4_mapped()) {
        auto b = v6.to_bytes();
        return IsForbiddenV4({b[12], b[13], b[14], b[15]});
    }
    if (v6.is_unspecified() || v6.is_loopback()) return true;

    auto b = v6.to_bytes();
    // fc00::/7 unique local
    if ((b[0] & 0xFE) == 0xFC) return true;
    // fe80::/10 link-local unicast
    if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true;
    // ff02::/16 link-local multicast
    if (b[0] == 0xFF && (b[1] & 0x0F) == 0x02) return true;
    return false;
}

}

namespace ReadServe {
namespace IpPolicy {

bool IsForbidden(const boost::asio::ip::address& addr) {
    if (addr.is_v4()) {
        return IsForbiddenV4(addr.to_v4().to_bytes());
    }
    return IsForbiddenV6(addr.to_v6());
}

bool IsForbidden(const std::string& ip) {
    boost::system::error_code ec;
    auto addr = boost::asio::ip::make_address(ip, ec);
    if (ec) return true;
    return IsForbidden(addr);
}

}
}
