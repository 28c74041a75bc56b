/*
    Copyright (c) 2011-2015 Andrey Sibiryov <me@kobology.ru>
    Copyright (c) 2011-2015 Other contributors as noted in the AUTHORS file.

    This file is part of Enclave.

    Enclave is free software; you can redistribute it and/or modify
    it under the terms of the GNU Lesser General Public License as published by
    the Free Software Foundation; either version 3 of the License, or
    (at your option) any later version.

    Enclave is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/


#include "enclave/common.hpp"
#include "enclave/config.hpp"
#include "enclave/deployer.hpp"
#include "enclave/errors.hpp"
#include "enclave/host.hpp"
#include "enclave/logging.hpp"

#include "enclave/detail/runtime/logging.hpp"

#if !defined(__APPLE__)
    #include "enclave/detail/runtime/pid_file.hpp"
#endif

#include <csignal>
#include <iostream>
#include <sstream>

#include <boost/asio/io_service.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/config/json.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/extensions/writer.hpp>
#include <blackhole/logger.hpp>
#include <blackhole/record.hpp>
#include <blackhole/registry.hpp>
#include <blackhole/root.hpp>
#include <blackhole/wrapper.hpp>

#if defined(__linux__)
    #define BACKWARD_HAS_BFD 1
#endif
#include <backward.hpp>

using namespace enclave;

namespace po = boost::program_options;

int
main(int argc, char* argv[]) {
    po::options_description general_options("General options");
    po::variables_map vm;

    general_options.add_options()
        ("help,h", "show this message")
        ("configuration,c", po::value<std::string>(), "location of the configuration file")
        ("logging,l", po::value<std::string>()->default_value("core"), "logging backend")
#if !defined(__APPLE__)
        ("daemonize,d", "daemonize on start")
        ("pidfile,p", po::value<std::string>(), "location of a pid file")
#endif
        ("version,v", "show version and build information");

    try {
        po::store(po::command_line_parser(argc, argv).options(general_options).run(), vm);
        po::notify(vm);
    } catch(const po::error& e) {
        std::cerr << enclave::format("ERROR: {}.", e.what()) << std::endl;
        return EXIT_FAILURE;
    }

    if(vm.count("help")) {
        std::cout << enclave::format("USAGE: {} [options]", argv[0]) << std::endl;
        std::cout << general_options;
        return EXIT_SUCCESS;
    }

    if(vm.count("version")) {
        std::cout << enclave::format("Enclave {}.{}.{}", ENCLAVE_VERSION_MAJOR, ENCLAVE_VERSION_MINOR,
            ENCLAVE_VERSION_RELEASE) << std::endl;
        return EXIT_SUCCESS;
    }

    // Validation

    if(!vm.count("configuration")) {
        std::cerr << "ERROR: no configuration file location has been specified." << std::endl;
        return EXIT_FAILURE;
    }

    // Crash reports.
    backward::SignalHandling crash_handler;

    // Startup

    std::unique_ptr<config_t> config;

    std::cout << "[Runtime] Parsing the configuration." << std::endl;

    try {
        config = make_config(vm["configuration"].as<std::string>());
    } catch(const std::system_error& e) {
        std::cerr << enclave::format("ERROR: unable to initialize the configuration - {}.", error::to_string(e)) << std::endl;
        return EXIT_FAILURE;
    }

#if !defined(__APPLE__)
    std::unique_ptr<pid_file_t> pidfile;

    if(vm.count("daemonize")) {
        if(daemon(0, 0) < 0) {
            std::cerr << "ERROR: daemonization failed." << std::endl;
            return EXIT_FAILURE;
        }

        boost::filesystem::path pid_path;

        if(!vm["pidfile"].empty()) {
            pid_path = vm["pidfile"].as<std::string>();
        } else {
            pid_path = boost::filesystem::path(config->path().root()) / "enclaved.pid";
        }

        try {
            pidfile.reset(new pid_file_t(pid_path));
        } catch(const std::system_error& e) {
            std::cerr << enclave::format("ERROR: unable to create the pidfile - {}.", error::to_string(e)) << std::endl;
            return EXIT_FAILURE;
        }
    }
#endif

    // Logging

    const auto backend = vm["logging"].as<std::string>();

    std::cout << enclave::format("[Runtime] Initializing the logging system, backend: {}.", backend)
              << std::endl;

    std::unique_ptr<blackhole::root_logger_t> root;
    std::unique_ptr<logging::logger_t> logger;

    auto registry = blackhole::registry::configured();
    registry->add<logging::console_t>(config->logging());

    try {
        std::stringstream stream;
        stream << config->logging().loggers();

        auto log = registry->builder<blackhole::config::json_t>(stream)
            .build(backend);

        const auto severity = config->logging().severity();

        root.reset(new blackhole::root_logger_t(std::move(log)));
        root->filter([=](const blackhole::record_t& record) -> bool {
            return record.severity() >= severity;
        });

        logger.reset(new blackhole::wrapper_t(*root, {{"source", "core"}}));
    } catch(const std::exception& e) {
        std::cerr << "ERROR: unable to initialize the logging: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    ENCLAVE_LOG_INFO(logger, "initializing the server");

    const auto applications = config->deploy().applications();

    std::unique_ptr<host_t> host;

    try {
        host.reset(new host_t(std::move(config), std::move(logger)));
    } catch(const std::system_error& e) {
        ENCLAVE_LOG_ERROR(root, "unable to initialize the host - {}.", error::to_string(e));
        return EXIT_FAILURE;
    }

    std::unique_ptr<deployer_t> deployer(new deployer_t(*host));

    for(auto it = applications.begin(); it != applications.end(); ++it) {
        try {
            deployer->deploy(*it);
        } catch(const std::system_error& e) {
            // Other applications must not be affected, keep going.
            ENCLAVE_LOG_ERROR(root, "unable to deploy '{}' - {}: {}", *it, error::to_string(e),
                error::root_cause(e));
        }
    }

    // Signal handling.

    boost::asio::io_service loop;
    boost::asio::signal_set signals(loop, SIGINT, SIGTERM, SIGQUIT);

    std::signal(SIGPIPE, SIG_IGN);

    signals.async_wait([&](const boost::system::error_code& ec, int signum) {
        if(!ec) {
            ENCLAVE_LOG_INFO(root, "caught signal {}, shutting down", signum);
        }
    });

    loop.run();

    deployer.reset();
    host.reset();

    return EXIT_SUCCESS;
}
