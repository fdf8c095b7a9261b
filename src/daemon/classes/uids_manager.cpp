#include <daemon/classes/uids_manager.hpp>
#include <daemon/backend/exceptions.hpp>
#include <global/configure.hpp>
#include <global/exceptions.hpp>
#include <global/log_util.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

using namespace std;

namespace dyna {

namespace {

// seed the cheap generator once with some entropy from the system
uint64_t strong_seed() {
    random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

/*
 * Strict parse of a marker name. Entries that are not plain decimal numbers are not ours
 */
bool parse_uid(const string& key, UID& uid) {
    if (key.empty() || key.size() > 10 || key.find_first_not_of("0123456789") != string::npos) {
        return false;
    }
    auto value = stoll(key);
    if (value > numeric_limits<UID>::max()) {
        return false;
    }
    uid = static_cast<UID>(value);
    return true;
}

} // namespace

UidsManager::UidsManager(shared_ptr<backend::KeyStore> store, UID min_uid, UID max_uid) :
    store_(move(store)),
    log_(get_logger(config::logger::allocator)),
    min_uid_(min_uid),
    max_uid_(max_uid),
    max_retries_(config::retry_factor * (static_cast<unsigned long>(max_uid_) - min_uid_ + 1)),
    rng_(strong_seed())
{
    if (!store_) {
        throw invalid_argument("UidsManager needs a key store");
    }
    if (min_uid_ < 0) {
        throw error::ConfigurationException(fmt::format("Invalid min uid {}: must be >= 0", min_uid_));
    }
    if (min_uid_ > max_uid_) {
        throw error::ConfigurationException(
                fmt::format("Invalid uid range [{}, {}]: min uid is greater than max uid", min_uid_, max_uid_));
    }
}

UID UidsManager::draw() {
    uniform_int_distribution<UID> dist(min_uid_, max_uid_);
    lock_guard<mutex> lock(rng_mutex_);
    return dist(rng_);
}

/**
 * Tries random uids in [min_uid, max_uid] until one can be claimed. With a good random
 * distribution a few times the number of possible uids is enough attempts to have tried
 * every one of them. Contention is never waited on, a taken uid just means another draw
 * @return the reserved uid
 */
UID UidsManager::reserve() {
    for (unsigned long i = 0; i < max_retries_; ++i) {
        auto uid = draw();
        // check if free by optimistically locking this uid
        if (store_->create(to_string(uid))) {
            log_->trace("{}() reserved uid {} after {} collisions", __func__, uid, i);
            return uid;
        }
    }
    log_->error("{}() no free uid in [{}, {}] after {} attempts", __func__, min_uid_, max_uid_, max_retries_);
    throw backend::CapacityExhaustedException(
            fmt::format("no free number available at {}", store_->location()));
}

void UidsManager::free(UID uid) {
    if (uid < min_uid_ || uid > max_uid_) {
        throw backend::NotReservedException(
                fmt::format("uid {} is outside of [{}, {}] and cannot be reserved", uid, min_uid_, max_uid_));
    }
    store_->remove(to_string(uid));
}

bool UidsManager::is_reserved(UID uid) const {
    if (uid < min_uid_ || uid > max_uid_) {
        return false;
    }
    return store_->exists(to_string(uid));
}

vector<UID> UidsManager::reserved() const {
    vector<UID> uids;
    for (const auto& key : store_->keys()) {
        UID uid;
        if (parse_uid(key, uid) && uid >= min_uid_ && uid <= max_uid_) {
            uids.push_back(uid);
        }
    }
    sort(uids.begin(), uids.end());
    return uids;
}

UID UidsManager::min_uid() const {
    return min_uid_;
}

UID UidsManager::max_uid() const {
    return max_uid_;
}

unsigned long UidsManager::interval() const {
    return static_cast<unsigned long>(max_uid_) - min_uid_ + 1;
}

unsigned long UidsManager::max_retries() const {
    return max_retries_;
}

} // namespace dyna
