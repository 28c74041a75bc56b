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


#ifndef ENCLAVE_DEFAULTS_HPP
#define ENCLAVE_DEFAULTS_HPP

#include <chrono>
#include <string>

namespace enclave {

struct defaults {
    // Default paths.
    static const std::string root_path;
    static const std::string plugins_path;

    // Installation layout.
    static const std::string applications_dir;
    static const std::string domains_dir;
    static const std::string libraries_dir;
    static const std::string anchor_suffix;
    static const std::string anchor_blurb;

    // Deployment descriptor.
    static const std::string descriptor_name;
    static const std::string config_resource;
    static const std::string default_domain;
    static const std::string default_builder;

    // Implicit application properties.
    static const std::string app_home_property;
    static const std::string app_name_property;

    // Hot-redeploy and anchor polling.
    static const std::chrono::milliseconds reload_interval;
    static const std::chrono::milliseconds anchor_interval;

    // Defaults for logging.
    static const std::string log_severity;
};

} // namespace enclave

#endif
