/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_KEY_STORE_HPP
#define DYNA_KEY_STORE_HPP

#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace dyna {
namespace backend {

/*
 * Set of keys with atomic create-if-absent and delete. Mutual exclusion between
 * reservations rests entirely on create() failing cleanly for an existing key
 */
class KeyStore {
    public:
        virtual ~KeyStore() = default;

        /**
         * @return true if the key was created, false if it already existed
         * @throws StorageException
         */
        virtual bool create(const std::string& key) = 0;

        /**
         * @throws NotReservedException if the key does not exist
         * @throws StorageException
         */
        virtual void remove(const std::string& key) = 0;

        virtual bool exists(const std::string& key) const = 0;
        virtual std::vector<std::string> keys() const = 0;
        virtual std::string location() const = 0;
};

/*
 * One zero-length marker file per key. Safe across processes sharing the directory
 * as long as the filesystem provides atomic exclusive create
 */
class DirKeyStore : public KeyStore {
    private:
        std::string root_path_;
        inline std::string absolute(const std::string& key) const;

    public:
        explicit DirKeyStore(const std::string& path);
        bool create(const std::string& key) override;
        void remove(const std::string& key) override;
        bool exists(const std::string& key) const override;
        std::vector<std::string> keys() const override;
        std::string location() const override;
};

class MemoryKeyStore : public KeyStore {
    private:
        mutable std::mutex mutex_;
        std::set<std::string> keys_;

    public:
        bool create(const std::string& key) override;
        void remove(const std::string& key) override;
        bool exists(const std::string& key) const override;
        std::vector<std::string> keys() const override;
        std::string location() const override;
};

} // namespace backend
} // namespace dyna

#endif //DYNA_KEY_STORE_HPP
