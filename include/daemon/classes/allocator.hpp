/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_ALLOCATOR_HPP
#define DYNA_ALLOCATOR_HPP

#include <daemon/backend/key_store.hpp>
#include <daemon/classes/subnet_mapper.hpp>
#include <daemon/classes/uids_manager.hpp>
#include <global/net_util.hpp>

#include <memory>
#include <string>
#include <vector>

/* Forward declarations */
namespace spdlog {
    class logger;
}

namespace dyna {

struct AllocatorOptions {
    std::string work_dir;
    net::Ipv4Network supernet;
    net::Ipv4Address anchor;
    UID min_uid;
    UID max_uid;

    AllocatorOptions();

    /**
     * Defaults overridden by DYNA_WORKDIR, DYNA_SUPERNET, DYNA_MIN_UID and DYNA_MAX_UID
     * @throws error::ConfigurationException
     */
    static AllocatorOptions from_env();
};

/**
 * Parses a uid given as text, e.g. from the environment or the command line
 * @throws error::ConfigurationException
 */
UID parse_uid_option(const std::string& name, const std::string& value);

/*
 * Allocates globally unique (per host) resources: uids reserved in a directory shared by
 * every allocator of the host, and the /30 network that belongs to each uid
 */
class Allocator {
    private:
        std::shared_ptr<spdlog::logger> log_;
        std::string uids_dir_;
        SubnetMapper mapper_;
        UidsManager uids_;

        static SubnetMapper make_mapper(const net::Ipv4Network& supernet, net::Ipv4Address anchor,
                                        UID min_uid, UID max_uid);
        void log_setup() const;

    public:
        /**
         * Creates <work_dir>/uids (owner only) and keeps the markers there.
         *
         * Two live uids never share a subnet because (max_uid - min_uid + 1) must not exceed
         * the /30 subnets the supernet provides after the anchor. E.g.: 172.17/16 provides
         * 2 ** (30-16) = 16384 /30 subnets, so at most 16384 uids.
         * @throws error::ConfigurationException
         * @throws backend::StorageException
         */
        explicit Allocator(const AllocatorOptions& opts);

        Allocator(std::shared_ptr<backend::KeyStore> store,
                  const net::Ipv4Network& supernet, net::Ipv4Address anchor,
                  UID min_uid, UID max_uid);

        /**
         * uids reserved here must be returned with free_uid when not required anymore
         * @throws backend::CapacityExhaustedException
         * @throws backend::StorageException
         */
        UID reserve_uid();

        /**
         * @throws backend::NotReservedException
         * @throws backend::StorageException
         */
        void free_uid(UID uid);

        /**
         * @throws error::OutOfRangeException
         */
        net::Ipv4Network subnet_for_uid(UID uid) const;

        bool is_reserved(UID uid) const;
        std::vector<UID> reserved_uids() const;

        const std::string& uids_dir() const;
        const SubnetMapper& mapper() const;
        uint32_t available_subnets() const;
};

} // namespace dyna

#endif //DYNA_ALLOCATOR_HPP
