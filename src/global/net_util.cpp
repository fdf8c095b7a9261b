/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <global/net_util.hpp>
#include <global/exceptions.hpp>

#include <fmt/format.h>

extern "C" {
#include <arpa/inet.h>
}

using namespace std;

namespace dyna {
namespace net {

Ipv4Address parse_ipv4(const string& addr_str) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr) != 1) {
        throw error::NetworkAddrException(fmt::format("Invalid IPv4 address '{}'", addr_str));
    }
    return ntohl(addr.s_addr);
}

string ipv4_to_string(Ipv4Address addr) {
    struct in_addr in{};
    in.s_addr = htonl(addr);
    char buf[INET_ADDRSTRLEN];
    if (inet_ntop(AF_INET, &in, buf, sizeof(buf)) == nullptr) {
        throw error::NetworkAddrException(
                fmt::format("Unable to convert address {:#010x} to string", addr));
    }
    return buf;
}

uint32_t prefix_mask(unsigned int prefix_length) {
    if (prefix_length == 0) {
        return 0;
    }
    if (prefix_length >= 32) {
        return UINT32_MAX;
    }
    return UINT32_MAX << (32 - prefix_length);
}

Ipv4Network::Ipv4Network()
    : address_(0)
    , prefix_length_(32)
{}

Ipv4Network::Ipv4Network(Ipv4Address address, unsigned int prefix_length)
    : address_(address)
    , prefix_length_(prefix_length)
{
    if (prefix_length_ > 32) {
        throw error::NetworkAddrException(
                fmt::format("Invalid IPv4 prefix length {}", prefix_length_));
    }
}

Ipv4Address Ipv4Network::address() const {
    return address_;
}

unsigned int Ipv4Network::prefix_length() const {
    return prefix_length_;
}

uint32_t Ipv4Network::mask() const {
    return prefix_mask(prefix_length_);
}

Ipv4Address Ipv4Network::network() const {
    return address_ & mask();
}

bool Ipv4Network::contains(Ipv4Address addr) const {
    return (addr & mask()) == network();
}

string Ipv4Network::to_string() const {
    return fmt::format("{}/{}", ipv4_to_string(address_), prefix_length_);
}

bool Ipv4Network::operator==(const Ipv4Network& other) const {
    return address_ == other.address_ && prefix_length_ == other.prefix_length_;
}

bool Ipv4Network::operator!=(const Ipv4Network& other) const {
    return !(*this == other);
}

Ipv4Network parse_cidr(const string& cidr) {
    auto sep_pos = cidr.find('/');
    if (sep_pos == string::npos) {
        throw error::NetworkAddrException(
                fmt::format("Invalid CIDR '{}': missing prefix length", cidr));
    }
    auto addr = parse_ipv4(cidr.substr(0, sep_pos));
    auto len_str = cidr.substr(sep_pos + 1);
    if (len_str.empty() || len_str.size() > 2 ||
        len_str.find_first_not_of("0123456789") != string::npos) {
        throw error::NetworkAddrException(
                fmt::format("Invalid CIDR '{}': bad prefix length '{}'", cidr, len_str));
    }
    return Ipv4Network(addr, static_cast<unsigned int>(stoul(len_str)));
}

ostream& operator<<(ostream& os, const Ipv4Network& net) {
    return os << net.to_string();
}

} // namespace net
} // namespace dyna
