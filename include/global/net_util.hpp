/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_NET_UTIL_HPP
#define DYNA_NET_UTIL_HPP

#include <cstdint>
#include <ostream>
#include <string>

namespace dyna {
namespace net {

// IPv4 address in host byte order
using Ipv4Address = uint32_t;

Ipv4Address parse_ipv4(const std::string& addr_str);

std::string ipv4_to_string(Ipv4Address addr);

uint32_t prefix_mask(unsigned int prefix_length);

class Ipv4Network {
    private:
        Ipv4Address address_;
        unsigned int prefix_length_;

    public:
        Ipv4Network();
        Ipv4Network(Ipv4Address address, unsigned int prefix_length);

        Ipv4Address address() const;
        unsigned int prefix_length() const;
        uint32_t mask() const;

        // the address with all host bits cleared
        Ipv4Address network() const;

        bool contains(Ipv4Address addr) const;

        std::string to_string() const;

        bool operator==(const Ipv4Network& other) const;
        bool operator!=(const Ipv4Network& other) const;
};

/**
 * Parses "a.b.c.d/n". The host bits of the address are kept as given
 * @throws error::NetworkAddrException
 */
Ipv4Network parse_cidr(const std::string& cidr);

std::ostream& operator<<(std::ostream& os, const Ipv4Network& net);

} // namespace net
} // namespace dyna

#endif //DYNA_NET_UTIL_HPP
