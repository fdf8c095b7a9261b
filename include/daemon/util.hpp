/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_UTIL_HPP
#define DYNA_UTIL_HPP

#include <global/net_util.hpp>

#include <string>
#include <utility>
#include <vector>

namespace dyna {

class SubnetMapper;

namespace util {
        void create_private_dir(const std::string& path);

        std::vector<std::pair<std::string, net::Ipv4Address>> get_interf_ips();

        std::vector<std::pair<std::string, net::Ipv4Address>> conflicting_interf_ips(
                const SubnetMapper& mapper,
                const std::vector<std::pair<std::string, net::Ipv4Address>>& interf_ips);
}
}

#endif //DYNA_UTIL_HPP
