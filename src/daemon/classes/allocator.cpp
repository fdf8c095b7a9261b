/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <daemon/classes/allocator.hpp>
#include <daemon/backend/exceptions.hpp>
#include <daemon/util.hpp>
#include <global/configure.hpp>
#include <global/exceptions.hpp>
#include <global/log_util.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <limits>

using namespace std;

namespace dyna {

namespace {

string env_or(const char* name, const string& fallback) {
    string env_key = ENV_PREFIX;
    env_key += name;
    char* value = getenv(env_key.c_str());
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

shared_ptr<backend::KeyStore> open_dir_store(const string& path) {
    util::create_private_dir(path);
    return make_shared<backend::DirKeyStore>(path);
}

} // namespace

AllocatorOptions::AllocatorOptions() :
    work_dir(config::default_work_dir),
    supernet(net::parse_cidr(config::default_supernet)),
    anchor(supernet.address()),
    min_uid(config::default_min_uid),
    max_uid(config::default_max_uid)
{}

AllocatorOptions AllocatorOptions::from_env() {
    AllocatorOptions opts;
    opts.work_dir = env_or("WORKDIR", opts.work_dir);
    auto supernet_str = env_or("SUPERNET", "");
    if (!supernet_str.empty()) {
        opts.supernet = net::parse_cidr(supernet_str);
        opts.anchor = opts.supernet.address();
    }
    auto min_str = env_or("MIN_UID", "");
    if (!min_str.empty()) {
        opts.min_uid = parse_uid_option(ENV_PREFIX "MIN_UID", min_str);
    }
    auto max_str = env_or("MAX_UID", "");
    if (!max_str.empty()) {
        opts.max_uid = parse_uid_option(ENV_PREFIX "MAX_UID", max_str);
    }
    return opts;
}

UID parse_uid_option(const string& name, const string& value) {
    if (value.empty() || value.size() > 10 || value.find_first_not_of("0123456789") != string::npos) {
        throw error::ConfigurationException(fmt::format("Invalid {} '{}': not a uid", name, value));
    }
    auto uid = stoll(value);
    if (uid > numeric_limits<UID>::max()) {
        throw error::ConfigurationException(fmt::format("Invalid {} '{}': too large", name, value));
    }
    return static_cast<UID>(uid);
}


Allocator::Allocator(const AllocatorOptions& opts) :
    log_(get_logger(config::logger::allocator)),
    uids_dir_(opts.work_dir + '/' + config::uids_dir_name),
    mapper_(make_mapper(opts.supernet, opts.anchor, opts.min_uid, opts.max_uid)),
    uids_(open_dir_store(uids_dir_), opts.min_uid, opts.max_uid)
{
    log_setup();
}

Allocator::Allocator(shared_ptr<backend::KeyStore> store,
                     const net::Ipv4Network& supernet, net::Ipv4Address anchor,
                     UID min_uid, UID max_uid) :
    log_(get_logger(config::logger::allocator)),
    uids_dir_(store ? store->location() : ""),
    mapper_(make_mapper(supernet, anchor, min_uid, max_uid)),
    uids_(move(store), min_uid, max_uid)
{
    log_setup();
}

/**
 * Builds the subnet mapper and makes sure it can give every uid of the range its own subnet
 * @throws error::ConfigurationException
 */
SubnetMapper Allocator::make_mapper(const net::Ipv4Network& supernet, net::Ipv4Address anchor,
                                    UID min_uid, UID max_uid) {
    if (min_uid < 0 || min_uid > max_uid) {
        throw error::ConfigurationException(
                fmt::format("Invalid uid range [{}, {}]", min_uid, max_uid));
    }
    SubnetMapper mapper(supernet, anchor, min_uid);
    auto interval = static_cast<uint64_t>(max_uid) - min_uid + 1;
    if (interval > mapper.available_subnets()) {
        throw error::ConfigurationException(
                fmt::format("uid range [{}, {}] holds {} uids but {} starting at {} provides only {} /30 subnets",
                            min_uid, max_uid, interval, mapper.supernet().to_string(),
                            mapper.anchor().to_string(), mapper.available_subnets()));
    }
    return mapper;
}

void Allocator::log_setup() const {
    log_->info("{}() uids [{}, {}] in '{}', subnets from {} starting at {} ({} available)", __func__,
               uids_.min_uid(), uids_.max_uid(), uids_dir_, mapper_.supernet().to_string(),
               mapper_.anchor().to_string(), mapper_.available_subnets());
    try {
        for (auto& e : util::conflicting_interf_ips(mapper_, util::get_interf_ips())) {
            log_->warn("{}() Interface '{}' has address {} inside the allocatable subnets", __func__,
                       e.first, net::ipv4_to_string(e.second));
        }
    } catch (const error::NetworkAddrException& e) {
        log_->warn("{}() Unable to check interface addresses: {}", __func__, e.what());
    }
}

UID Allocator::reserve_uid() {
    try {
        auto uid = uids_.reserve();
        log_->debug("{}() Reserved uid {}", __func__, uid);
        return uid;
    } catch (const backend::StorageException& e) {
        log_->error("{}() Reservation failed: {}", __func__, e.what());
        throw;
    }
}

void Allocator::free_uid(UID uid) {
    uids_.free(uid);
    log_->debug("{}() Freed uid {}", __func__, uid);
}

net::Ipv4Network Allocator::subnet_for_uid(UID uid) const {
    auto subnet = mapper_.subnet_for(uid);
    log_->trace("{}() uid {} -> {}", __func__, uid, subnet.to_string());
    return subnet;
}

bool Allocator::is_reserved(UID uid) const {
    return uids_.is_reserved(uid);
}

vector<UID> Allocator::reserved_uids() const {
    return uids_.reserved();
}

const string& Allocator::uids_dir() const {
    return uids_dir_;
}

const SubnetMapper& Allocator::mapper() const {
    return mapper_;
}

uint32_t Allocator::available_subnets() const {
    return mapper_.available_subnets();
}

} // namespace dyna
