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


#include "enclave/defaults.hpp"

using namespace enclave;

const std::string defaults::root_path        = "/var/lib/enclave";
const std::string defaults::plugins_path     = "/usr/lib/enclave";

const std::string defaults::applications_dir = "apps";
const std::string defaults::domains_dir      = "domains";
const std::string defaults::libraries_dir    = "lib";
const std::string defaults::anchor_suffix    = "-anchor.txt";
const std::string defaults::anchor_blurb     =
    "Delete this file while Enclave is running to undeploy this app in a clean way.";

const std::string defaults::descriptor_name  = "enclave-deploy.json";
const std::string defaults::config_resource  = "enclave-config.json";
const std::string defaults::default_domain   = "default";
const std::string defaults::default_builder  = "auto";

const std::string defaults::app_home_property = "app.home";
const std::string defaults::app_name_property = "app.name";

const std::chrono::milliseconds defaults::reload_interval(3000);
const std::chrono::milliseconds defaults::anchor_interval(1000);

const std::string defaults::log_severity     = "info";
