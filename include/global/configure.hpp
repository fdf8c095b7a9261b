/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_CONFIGURE_HPP
#define DYNA_CONFIGURE_HPP

#include <sys/types.h>

// environment variables read by the allocator are prefixed with this
#define ENV_PREFIX "DYNA_"

#define DEFAULT_LOG_PATH "/tmp/dyna-alloc.log"
#define DEFAULT_LOG_LEVEL "info"

namespace dyna {
    namespace config {
        /*
         * By default allocate from the RFC1918 172.16/12 block, which provides at most
         * 2**18 = 262144 subnets of size /30. The first few addresses are skipped to
         * avoid clashes with addresses used by cloud infrastructure (e.g., the EC2-classic
         * internal DNS server is 172.16.0.23).
         */
        constexpr auto default_supernet = "172.16.0.28/12";

        constexpr auto default_work_dir = "/tmp/dyna";
        constexpr int default_min_uid = 3000;
        constexpr int default_max_uid = 60000;

        // subdirectory of the work dir holding one marker per reserved uid
        constexpr auto uids_dir_name = "uids";
        constexpr mode_t uids_dir_mode = 0700;
        constexpr mode_t marker_mode = 0600;

        // reservation gives up after retry_factor * (max_uid - min_uid + 1) draws
        constexpr int retry_factor = 5;

        // every uid gets a point-to-point /30 network
        constexpr unsigned int subnet_prefix_length = 30;

        namespace logger {
            constexpr auto main = "main";
            constexpr auto allocator = "allocator";
        }
    }
}

#endif //DYNA_CONFIGURE_HPP
