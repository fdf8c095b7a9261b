/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <daemon/classes/subnet_mapper.hpp>
#include <global/configure.hpp>
#include <global/exceptions.hpp>

#include <fmt/format.h>

using namespace std;

namespace dyna {

SubnetMapper::SubnetMapper(const net::Ipv4Network& supernet, net::Ipv4Address anchor, UID min_uid) :
    min_uid_(min_uid)
{
    auto prefix_length = supernet.prefix_length();
    if (prefix_length > config::subnet_prefix_length) {
        throw error::ConfigurationException(
                fmt::format("Supernet {} is too small: prefix length must be at most /{}",
                            supernet.to_string(), config::subnet_prefix_length));
    }
    supernet_ = net::Ipv4Network(supernet.network(), prefix_length);
    if (!supernet_.contains(anchor)) {
        throw error::ConfigurationException(
                fmt::format("Anchor {} lies outside of supernet {}",
                            net::ipv4_to_string(anchor), supernet_.to_string()));
    }
    anchor_ = net::Ipv4Network(anchor & net::prefix_mask(config::subnet_prefix_length),
                               config::subnet_prefix_length);

    // how many /30 subnets can the block generate? 2 ** (30 - prefix_length) - subnets_to_skip
    uint64_t total = uint64_t{1} << (config::subnet_prefix_length - prefix_length);
    uint64_t to_skip = subnets_to_skip(anchor, prefix_length);
    if (to_skip >= total) {
        throw error::ConfigurationException(
                fmt::format("No /30 subnets left in {} after anchor {}",
                            supernet_.to_string(), anchor_.to_string()));
    }
    available_subnets_ = static_cast<uint32_t>(total - to_skip);
}

SubnetMapper::SubnetMapper(const net::Ipv4Network& anchored_supernet, UID min_uid) :
    SubnetMapper(anchored_supernet, anchored_supernet.address(), min_uid)
{}

uint32_t SubnetMapper::subnets_to_skip(net::Ipv4Address anchor, unsigned int prefix_length) {
    // cut the first prefix_length bits
    auto to_skip = anchor & ~net::prefix_mask(prefix_length);
    // cut the last 2 bits
    return to_skip >> 2;
}

net::Ipv4Network SubnetMapper::subnet_for(UID uid) const {
    // wrap the uid space onto the subnet space, uids below min_uid wrap as well
    auto offset = static_cast<int64_t>(uid) - min_uid_;
    auto shift = static_cast<uint32_t>(
            ((offset % available_subnets_) + available_subnets_) % available_subnets_);

    // pick a /30 block
    uint32_t addr = anchor_.address();
    addr >>= 2;
    addr += shift;
    addr <<= 2;

    if (!supernet_.contains(addr)) {
        throw error::OutOfRangeException(
                fmt::format("The assigned IP {} for uid {} falls out of the allowed subnet {}",
                            net::ipv4_to_string(addr), uid, supernet_.to_string()));
    }
    return net::Ipv4Network(addr, config::subnet_prefix_length);
}

const net::Ipv4Network& SubnetMapper::supernet() const {
    return supernet_;
}

const net::Ipv4Network& SubnetMapper::anchor() const {
    return anchor_;
}

uint32_t SubnetMapper::available_subnets() const {
    return available_subnets_;
}

net::Ipv4Network SubnetMapper::first_subnet() const {
    return anchor_;
}

net::Ipv4Network SubnetMapper::last_subnet() const {
    return net::Ipv4Network(anchor_.address() + (available_subnets_ - 1) * 4u,
                            config::subnet_prefix_length);
}

} // namespace dyna
