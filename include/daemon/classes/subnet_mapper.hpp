/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_SUBNET_MAPPER_HPP
#define DYNA_SUBNET_MAPPER_HPP

#include <daemon/classes/uids_manager.hpp>
#include <global/net_util.hpp>

#include <cstdint>

namespace dyna {

/*
 * Maps every uid to its own /30 network inside a private supernet. Subnets are numbered
 * from the anchor onwards, so addresses of the supernet that precede the anchor are never
 * handed out. Pure arithmetic, nothing is stored
 */
class SubnetMapper {
    private:
        net::Ipv4Network supernet_;  // normalized to its network address
        net::Ipv4Network anchor_;    // first /30 handed out
        uint32_t available_subnets_;
        UID min_uid_;

    public:
        /**
         * @param supernet block to carve /30 networks from. Host bits are ignored
         * @param anchor first address to hand out, must be inside the supernet
         * @param min_uid the uid that gets the anchor subnet
         * @throws error::ConfigurationException
         */
        SubnetMapper(const net::Ipv4Network& supernet, net::Ipv4Address anchor, UID min_uid);

        /**
         * The anchor is taken from the address of the cidr, e.g.: 172.16.0.28/12 carves from
         * 172.16/12 starting at 172.16.0.28/30
         */
        SubnetMapper(const net::Ipv4Network& anchored_supernet, UID min_uid);

        /**
         * /30 blocks of the supernet that lie before the anchor. This is bits[prefix:30] of
         * the anchor address, e.g.: 172.16.0.28 in a /12 skips 7 blocks
         */
        static uint32_t subnets_to_skip(net::Ipv4Address anchor, unsigned int prefix_length);

        /**
         * Different uids get different subnets as long as no more than available_subnets()
         * consecutive uids are in use at the same time
         * @throws error::OutOfRangeException
         */
        net::Ipv4Network subnet_for(UID uid) const;

        const net::Ipv4Network& supernet() const;
        const net::Ipv4Network& anchor() const;
        uint32_t available_subnets() const;
        net::Ipv4Network first_subnet() const;
        net::Ipv4Network last_subnet() const;
};

} // namespace dyna

#endif //DYNA_SUBNET_MAPPER_HPP
