/*
  Copyright 2018-2019, Barcelona Supercomputing Center (BSC), Spain
  Copyright 2015-2019, Johannes Gutenberg Universitaet Mainz, Germany

  SPDX-License-Identifier: MIT
*/

#include <daemon/classes/allocator.hpp>
#include <daemon/backend/exceptions.hpp>
#include <global/configure.hpp>
#include <global/exceptions.hpp>
#include <global/log_util.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

extern "C" {
#include <getopt.h>
}

using namespace std;

namespace {

enum exit_code {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_CONFIG = 2,
    EXIT_CAPACITY = 3,
    EXIT_NOT_RESERVED = 4,
    EXIT_STORAGE = 5,
    EXIT_INTERNAL = 6
};

struct cli_options {
    dyna::AllocatorOptions alloc;
    string log_level;
    string log_path;
    string command;
    vector<string> args;
};

void usage(const char* prog) {
    cerr << "Usage: " << prog << " [options] <command>" << endl
         << endl
         << "Reserves per-host unique uids and derives the /30 network of each uid." << endl
         << endl
         << "Commands:" << endl
         << "  reserve        reserve a free uid, prints '<uid> <network>'" << endl
         << "  free <uid>     return a reserved uid" << endl
         << "  subnet <uid>   print the network of a uid" << endl
         << "  list           print every reserved uid with its network" << endl
         << "  info           print the configuration" << endl
         << endl
         << "Options (defaults come from the " ENV_PREFIX "* environment variables):" << endl
         << "  -w, --workdir <DIR>        directory holding the uids directory" << endl
         << "  -s, --supernet <CIDR>      block to carve subnets from, e.g. "
         << dyna::config::default_supernet << endl
         << "  -a, --anchor <ADDR>        first address to hand out (default: address of the supernet)" << endl
         << "  -m, --min-uid <UID>        lowest uid" << endl
         << "  -M, --max-uid <UID>        highest uid" << endl
         << "  -l, --log-level <LEVEL>    trace, debug, info, warning, err, critical or off" << endl
         << "  -L, --log-path <PATH>      log file" << endl
         << "  -h, --help                 show this help" << endl;
}

string env_or(const char* name, const string& fallback) {
    string env_key = ENV_PREFIX;
    env_key += name;
    char* value = getenv(env_key.c_str());
    return (value != nullptr && *value != '\0') ? value : fallback;
}

/**
 * Command line options override the environment
 * @return false if the program should exit with a usage error
 */
bool process_cl_args(int argc, char* argv[], cli_options& opts) {
    static struct option long_options[] = {
        {"workdir", required_argument, nullptr, 'w'},
        {"supernet", required_argument, nullptr, 's'},
        {"anchor", required_argument, nullptr, 'a'},
        {"min-uid", required_argument, nullptr, 'm'},
        {"max-uid", required_argument, nullptr, 'M'},
        {"log-level", required_argument, nullptr, 'l'},
        {"log-path", required_argument, nullptr, 'L'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, no_argument, nullptr, 0}
    };
    opts.alloc = dyna::AllocatorOptions::from_env();
    opts.log_level = env_or("LOG_LEVEL", DEFAULT_LOG_LEVEL);
    opts.log_path = env_or("LOG_PATH", DEFAULT_LOG_PATH);

    string anchor_str;
    int c, option_index = 0;
    while ((c = getopt_long(argc, argv, "w:s:a:m:M:l:L:h", long_options, &option_index)) >= 0) {
        switch (c) {
            case 'w':
                opts.alloc.work_dir = optarg;
                break;
            case 's':
                opts.alloc.supernet = dyna::net::parse_cidr(optarg);
                opts.alloc.anchor = opts.alloc.supernet.address();
                break;
            case 'a':
                anchor_str = optarg;
                break;
            case 'm':
                opts.alloc.min_uid = dyna::parse_uid_option("--min-uid", optarg);
                break;
            case 'M':
                opts.alloc.max_uid = dyna::parse_uid_option("--max-uid", optarg);
                break;
            case 'l':
                opts.log_level = optarg;
                break;
            case 'L':
                opts.log_path = optarg;
                break;
            case 'h':
            case '?':
            default:
                return false;
        }
    }
    // applied last so that it wins over the address of --supernet
    if (!anchor_str.empty()) {
        opts.alloc.anchor = dyna::net::parse_ipv4(anchor_str);
    }
    if (optind >= argc) {
        return false;
    }
    opts.command = argv[optind++];
    for (; optind < argc; ++optind) {
        opts.args.emplace_back(argv[optind]);
    }
    return true;
}

/**
 * A malformed uid argument is a usage error, not a configuration one
 * @return false if arg is not a uid
 */
bool parse_uid_arg(const string& arg, dyna::UID& uid) {
    try {
        uid = dyna::parse_uid_option("uid", arg);
    } catch (const dyna::error::ConfigurationException& e) {
        cerr << e.what() << endl;
        return false;
    }
    return true;
}

int run(const cli_options& opts) {
    dyna::UID arg_uid = 0;
    if ((opts.command == "free" || opts.command == "subnet") && opts.args.size() == 1 &&
        !parse_uid_arg(opts.args[0], arg_uid)) {
        return EXIT_USAGE;
    }

    dyna::Allocator allocator(opts.alloc);

    if (opts.command == "reserve" && opts.args.empty()) {
        auto uid = allocator.reserve_uid();
        cout << uid << " " << allocator.subnet_for_uid(uid) << endl;
    } else if (opts.command == "free" && opts.args.size() == 1) {
        allocator.free_uid(arg_uid);
    } else if (opts.command == "subnet" && opts.args.size() == 1) {
        cout << allocator.subnet_for_uid(arg_uid) << endl;
    } else if (opts.command == "list" && opts.args.empty()) {
        for (auto uid : allocator.reserved_uids()) {
            cout << uid << " " << allocator.subnet_for_uid(uid) << endl;
        }
    } else if (opts.command == "info" && opts.args.empty()) {
        const auto& mapper = allocator.mapper();
        cout << "uids dir:          " << allocator.uids_dir() << endl
             << "uid range:         [" << opts.alloc.min_uid << ", " << opts.alloc.max_uid << "]" << endl
             << "supernet:          " << mapper.supernet() << endl
             << "first subnet:      " << mapper.first_subnet() << endl
             << "last subnet:       " << mapper.last_subnet() << endl
             << "available subnets: " << allocator.available_subnets() << endl;
    } else {
        cerr << fmt::format("Unknown command or wrong arguments: '{}'", opts.command) << endl;
        return EXIT_USAGE;
    }
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    cli_options opts;
    try {
        if (!process_cl_args(argc, argv, opts)) {
            usage(argv[0]);
            return EXIT_USAGE;
        }
    } catch (const dyna::error::ConfigurationException& e) {
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_CONFIG;
    }

    try {
        setup_loggers({dyna::config::logger::main, dyna::config::logger::allocator},
                      get_spdlog_level(opts.log_level), opts.log_path);
    } catch (const spdlog::spdlog_ex& e) {
        cerr << "Unable to set up logging at '" << opts.log_path << "': " << e.what() << endl;
        return EXIT_CONFIG;
    } catch (const runtime_error& e) {
        cerr << e.what() << endl;
        return EXIT_USAGE;
    }
    auto log = spdlog::get(dyna::config::logger::main);
    log->debug("{}() command '{}'", __func__, opts.command);

    try {
        return run(opts);
    } catch (const dyna::error::ConfigurationException& e) {
        log->error("{}() Invalid configuration: {}", __func__, e.what());
        cerr << "Invalid configuration: " << e.what() << endl;
        return EXIT_CONFIG;
    } catch (const dyna::backend::CapacityExhaustedException& e) {
        cerr << e.what() << endl;
        return EXIT_CAPACITY;
    } catch (const dyna::backend::NotReservedException& e) {
        log->error("{}() {}", __func__, e.what());
        cerr << e.what() << endl;
        return EXIT_NOT_RESERVED;
    } catch (const dyna::backend::StorageException& e) {
        cerr << e.what() << endl;
        return EXIT_STORAGE;
    } catch (const dyna::error::OutOfRangeException& e) {
        log->critical("{}() {}", __func__, e.what());
        cerr << e.what() << endl;
        return EXIT_INTERNAL;
    }
}
