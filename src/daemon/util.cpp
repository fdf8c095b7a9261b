/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/
#include <daemon/util.hpp>
#include <daemon/backend/exceptions.hpp>
#include <daemon/classes/subnet_mapper.hpp>
#include <global/exceptions.hpp>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <cerrno>
#include <memory>

extern "C" {
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <netdb.h>
}

using namespace std;
namespace bfs = boost::filesystem;

namespace dyna {

/**
 * Creates path and its parents if missing and restricts path itself to its owner
 * @param path
 * @throws backend::StorageException
 */
void util::create_private_dir(const string& path) {
    boost::system::error_code ec;
    bfs::create_directories(path, ec);
    if (ec) {
        throw backend::StorageException(ec.value(),
                fmt::format("Failed to create directory '{}': {}", path, ec.message()));
    }
    bfs::permissions(path, bfs::owner_all, ec);
    if (ec) {
        throw backend::StorageException(ec.value(),
                fmt::format("Failed to restrict permissions of '{}': {}", path, ec.message()));
    }
}

/**
 * Gets all network interfaces and their IPv4 addresses.
 * @return list of pairs: (interface, ip)
 */
vector<pair<string, net::Ipv4Address>> util::get_interf_ips() {

    vector<pair<string, net::Ipv4Address>> interfaces{};
    struct ifaddrs* addrs_raw_ptr = nullptr;
    auto err = getifaddrs(&addrs_raw_ptr);
    if (err != 0) {
        auto err_str = fmt::format("Error getting network interfaces and ips. errno: {}", errno);
        throw error::NetworkAddrException(err_str);
    }
    unique_ptr<struct ifaddrs, decltype(&freeifaddrs)> addrs(addrs_raw_ptr, &freeifaddrs);
    // helper variable
    auto addr = addrs.get();
    while(addr) {
        if (addr->ifa_addr && addr->ifa_addr->sa_family == AF_INET) {
            auto sa = reinterpret_cast<struct sockaddr_in*>(addr->ifa_addr);
            interfaces.emplace_back(addr->ifa_name, ntohl(sa->sin_addr.s_addr));
        }
        addr = addr->ifa_next;
    }
    return interfaces;
}

/**
 * Filters the interface addresses that fall into a subnet the mapper may hand out
 * @param mapper
 * @param interf_ips
 * @return list of pairs: (interface, ip)
 */
vector<pair<string, net::Ipv4Address>> util::conflicting_interf_ips(
        const SubnetMapper& mapper,
        const vector<pair<string, net::Ipv4Address>>& interf_ips) {
    auto first = mapper.first_subnet().address();
    auto last = mapper.last_subnet().address() + 3;
    vector<pair<string, net::Ipv4Address>> conflicts{};
    for (auto& e : interf_ips) {
        if (e.second >= first && e.second <= last) {
            conflicts.push_back(e);
        }
    }
    return conflicts;
}

} // namespace dyna
