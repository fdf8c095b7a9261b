#ifndef DYNA_UIDS_MANAGER_HPP
#define DYNA_UIDS_MANAGER_HPP
#pragma once

#include <daemon/backend/key_store.hpp>

#include <memory>
#include <mutex>
#include <random>
#include <vector>

/* Forward declarations */
namespace spdlog {
    class logger;
}

namespace dyna {

using UID = int;

/*
 * Hands out uids in [min_uid, max_uid] by optimistically claiming random candidates
 * in a KeyStore. A uid is reserved iff the store holds its decimal representation
 */
class UidsManager {
    private:
       std::shared_ptr<backend::KeyStore> store_;
       std::shared_ptr<spdlog::logger> log_;
       const UID min_uid_;
       const UID max_uid_;
       const unsigned long max_retries_; // retry_factor * interval size
       std::mutex rng_mutex_; // serializes draws from rng_
       std::mt19937_64 rng_; // picks probe order only, not for security

       UID draw();

    public:
       UidsManager(std::shared_ptr<backend::KeyStore> store, UID min_uid, UID max_uid);

       /**
        * @throws backend::CapacityExhaustedException
        * @throws backend::StorageException
        */
       UID reserve();

       /**
        * @throws backend::NotReservedException
        * @throws backend::StorageException
        */
       void free(UID uid);

       bool is_reserved(UID uid) const;
       std::vector<UID> reserved() const;

       UID min_uid() const;
       UID max_uid() const;
       unsigned long interval() const;
       unsigned long max_retries() const;
};

} // namespace dyna

#endif //DYNA_UIDS_MANAGER_HPP
