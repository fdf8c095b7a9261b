/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#ifndef DYNA_LOG_UTIL_HPP
#define DYNA_LOG_UTIL_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

spdlog::level::level_enum get_spdlog_level(std::string level_str);

void setup_loggers(const std::vector<std::string>& loggers,
                   spdlog::level::level_enum level, const std::string& path);

std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

#endif //DYNA_LOG_UTIL_HPP
