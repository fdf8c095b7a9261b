/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <daemon/backend/key_store.hpp>
#include <daemon/backend/exceptions.hpp>
#include <global/configure.hpp>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <cerrno>
#include <cstring>

extern "C" {
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
}

using namespace std;
namespace bfs = boost::filesystem;

namespace dyna {
namespace backend {

DirKeyStore::DirKeyStore(const string& path) :
    root_path_(path)
{}

string DirKeyStore::absolute(const string& key) const {
    return root_path_ + '/' + key;
}

bool DirKeyStore::create(const string& key) {
    auto marker = absolute(key);
    // O_EXCL makes the check for existence and the creation a single atomic step
    auto fd = ::open(marker.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, config::marker_mode);
    if (fd < 0) {
        if (errno == EEXIST) {
            return false;
        }
        auto err = errno;
        throw StorageException(err, fmt::format("Failed to create marker '{}'", marker));
    }
    if (::close(fd) != 0) {
        auto err = errno;
        // nobody would own the marker otherwise
        ::unlink(marker.c_str());
        throw StorageException(err, fmt::format("Failed to close marker '{}'", marker));
    }
    return true;
}

void DirKeyStore::remove(const string& key) {
    auto marker = absolute(key);
    if (::unlink(marker.c_str()) != 0) {
        auto err = errno;
        if (err == ENOENT) {
            throw NotReservedException(fmt::format("No marker '{}' to remove", marker));
        }
        throw StorageException(err, fmt::format("Failed to remove marker '{}'", marker));
    }
}

bool DirKeyStore::exists(const string& key) const {
    auto marker = absolute(key);
    struct stat st{};
    if (::stat(marker.c_str(), &st) != 0) {
        auto err = errno;
        if (err == ENOENT) {
            return false;
        }
        throw StorageException(err, fmt::format("Failed to stat marker '{}'", marker));
    }
    return true;
}

vector<string> DirKeyStore::keys() const {
    vector<string> keys;
    boost::system::error_code ec;
    bfs::directory_iterator it(root_path_, ec);
    if (ec) {
        throw StorageException(ec.value(),
                fmt::format("Failed to list '{}': {}", root_path_, ec.message()));
    }
    bfs::directory_iterator end;
    while (it != end) {
        keys.push_back(it->path().filename().string());
        it.increment(ec);
        if (ec) {
            throw StorageException(ec.value(),
                    fmt::format("Failed to list '{}': {}", root_path_, ec.message()));
        }
    }
    return keys;
}

string DirKeyStore::location() const {
    return root_path_;
}


bool MemoryKeyStore::create(const string& key) {
    lock_guard<mutex> lock(mutex_);
    return keys_.insert(key).second;
}

void MemoryKeyStore::remove(const string& key) {
    lock_guard<mutex> lock(mutex_);
    if (keys_.erase(key) == 0) {
        throw NotReservedException(fmt::format("Key '{}' is not in memory store", key));
    }
}

bool MemoryKeyStore::exists(const string& key) const {
    lock_guard<mutex> lock(mutex_);
    return keys_.count(key) == 1;
}

vector<string> MemoryKeyStore::keys() const {
    lock_guard<mutex> lock(mutex_);
    return vector<string>(keys_.begin(), keys_.end());
}

string MemoryKeyStore::location() const {
    return "memory";
}

} // namespace backend
} // namespace dyna
