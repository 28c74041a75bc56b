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


#ifndef ENCLAVE_CONFIG_HPP
#define ENCLAVE_CONFIG_HPP

#include "enclave/common.hpp"

#include <chrono>

namespace enclave {

// Configuration

struct config_t {
public:
    virtual
    ~config_t() {}

    struct path_t {
        virtual
        ~path_t() {}

        // Installation root, see layout_t.
        virtual
        const std::string&
        root() const = 0;

        // Paths to search builder plugins for.
        virtual
        const std::vector<std::string>&
        plugins() const = 0;
    };

    struct deploy_t {
        virtual
        ~deploy_t() {}

        // Hot-redeploy poll interval.
        virtual
        std::chrono::milliseconds
        reload_interval() const = 0;

        // Anchor marker poll interval.
        virtual
        std::chrono::milliseconds
        anchor_interval() const = 0;

        // Applications deployed on startup.
        virtual
        const std::vector<std::string>&
        applications() const = 0;
    };

    struct logging_t {
        virtual
        ~logging_t() {}

        // Logger definitions in the Blackhole JSON format, serialized.
        virtual
        const std::string&
        loggers() const = 0;

        virtual
        logging::priorities
        severity() const = 0;

        // Console sink stream, either "stdout" or "stderr".
        virtual
        const std::string&
        console() const = 0;

        virtual
        bool
        colored() const = 0;
    };

    virtual
    const path_t&
    path() const = 0;

    virtual
    const deploy_t&
    deploy() const = 0;

    virtual
    const logging_t&
    logging() const = 0;

    static
    int
    versions();
};

std::unique_ptr<config_t>
make_config(const std::string& source);

} // namespace enclave

#endif
