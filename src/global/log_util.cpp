/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <global/log_util.hpp>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <list>
#include <mutex>
#include <stdexcept>

using namespace std;

spdlog::level::level_enum get_spdlog_level(string level_str) {
    transform(level_str.begin(), level_str.end(), level_str.begin(),
              [](unsigned char c) { return static_cast<char>(::tolower(c)); });
    if (level_str == "off") {
        return spdlog::level::off;
    } else if (level_str == "critical") {
        return spdlog::level::critical;
    } else if (level_str == "err" || level_str == "error") {
        return spdlog::level::err;
    } else if (level_str == "warn" || level_str == "warning") {
        return spdlog::level::warn;
    } else if (level_str == "info") {
        return spdlog::level::info;
    } else if (level_str == "debug") {
        return spdlog::level::debug;
    } else if (level_str == "trace") {
        return spdlog::level::trace;
    }
    throw runtime_error(fmt::format("Unknown log level '{}'", level_str));
}

/**
 * Registers one logger per name. All of them write to the same file sink
 * @param loggers_name
 * @param level
 * @param path
 */
void setup_loggers(const vector<string>& loggers_name,
                   spdlog::level::level_enum level, const string& path) {
    /* Create common sink */
    auto file_sink = make_shared<spdlog::sinks::basic_file_sink_mt>(path);

    /* Create and configure loggers */
    auto loggers = list<shared_ptr<spdlog::logger>>();
    for (const auto& name: loggers_name) {
        // replace whatever a previous setup (or get_logger) registered
        spdlog::drop(name);
        auto logger = make_shared<spdlog::logger>(name, file_sink);
        logger->flush_on(spdlog::level::warn);
        loggers.push_back(logger);
    }

    for (auto& logger: loggers) {
        spdlog::register_logger(logger);
    }

    // applies to every registered logger
    spdlog::set_pattern("[%Y-%m-%d %T.%f] [%P] [%n] [%l] %v");
    spdlog::set_level(level);
}

/**
 * Returns the logger registered under name. If the host process never set up logging
 * a logger that drops everything is registered instead
 * @param name
 * @return
 */
shared_ptr<spdlog::logger> get_logger(const string& name) {
    static mutex register_mutex;
    lock_guard<mutex> lock(register_mutex);
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = make_shared<spdlog::logger>(name, make_shared<spdlog::sinks::null_sink_mt>());
        spdlog::register_logger(logger);
    }
    return logger;
}
