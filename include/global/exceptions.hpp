/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <string>
#include <stdexcept>

#ifndef DYNA_EXCEPTIONS_HPP
#define DYNA_EXCEPTIONS_HPP

namespace dyna {
    namespace error {
        /*
         * Allocator configuration that cannot work, detected before any reservation is attempted
         */
        class ConfigurationException: public std::runtime_error {
        public:
            ConfigurationException(const std::string & s) : std::runtime_error(s) {};
        };

        class NetworkAddrException: public ConfigurationException {
        public:
            NetworkAddrException(const std::string & s) : ConfigurationException(s) {};
        };

        /*
         * A derived subnet fell outside of the supernet. Means the address-space accounting is broken
         */
        class OutOfRangeException: public std::logic_error {
        public:
            OutOfRangeException(const std::string & s) : std::logic_error(s) {};
        };
    }
}

#endif //DYNA_EXCEPTIONS_HPP
