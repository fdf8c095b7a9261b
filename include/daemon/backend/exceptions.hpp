/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_BACKEND_EXCEPTIONS_HPP
#define DYNA_BACKEND_EXCEPTIONS_HPP

#include <string>
#include <stdexcept>
#include <system_error>

namespace dyna {
namespace backend {

/*
 * Unexpected failure of the storage medium. Never retried
 */
class StorageException: public std::system_error {
    public:
        StorageException(const int err_code, const std::string & s) :
            std::system_error(err_code, std::system_category(), s) {};
};

class NotReservedException: public StorageException {
    public:
        NotReservedException(const std::string & s) : StorageException(ENOENT, s) {};
};

class CapacityExhaustedException: public std::runtime_error {
    public:
        CapacityExhaustedException(const std::string & s) : std::runtime_error(s) {};
};

} // namespace backend
} // namespace dyna

#endif //DYNA_BACKEND_EXCEPTIONS_HPP
