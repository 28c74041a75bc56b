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


#include "enclave/errors.hpp"

using namespace enclave;
using namespace enclave::error;

namespace {

class deployment_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "enclave.deployment";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case enclave::error::deployment_errors::installation_failed:
            return "unable to install the application";
        case enclave::error::deployment_errors::domain_not_found:
            return "specified domain does not exist";
        case enclave::error::deployment_errors::initialization_failed:
            return "unable to initialize the application";
        case enclave::error::deployment_errors::start_failed:
            return "unable to start the application";
        case enclave::error::deployment_errors::stop_failed:
            return "unable to stop the application";
        case enclave::error::deployment_errors::already_deployed:
            return "application is already deployed";
        case enclave::error::deployment_errors::not_deployed:
            return "application is not deployed";
        default:
            return "enclave.deployment error";
        }
    }
};

class descriptor_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "enclave.descriptor";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case enclave::error::descriptor_errors::descriptor_unreadable:
            return "unable to read the deployment descriptor";
        case enclave::error::descriptor_errors::descriptor_malformed:
            return "deployment descriptor is not a valid JSON object";
        case enclave::error::descriptor_errors::invalid_descriptor_value:
            return "deployment descriptor field has an unexpected type";
        default:
            return "enclave.descriptor error";
        }
    }
};

class repository_category_t:
    public std::error_category
{
    virtual
    auto
    name() const throw() -> const char* {
        return "enclave.plugins";
    }

    virtual
    auto
    message(int code) const -> std::string {
        switch(code) {
        case enclave::error::repository_errors::component_not_found:
            return "component is not available";
        case enclave::error::repository_errors::duplicate_component:
            return "duplicate component";
        case enclave::error::repository_errors::initialization_error:
            return "component has failed to initialize";
        case enclave::error::repository_errors::invalid_interface:
            return "component has an invalid interface";
        case enclave::error::repository_errors::dlopen_error:
            return "unable to load the plugin";
        case enclave::error::repository_errors::version_mismatch:
            return "component version requirements are not met";
        default:
            return "enclave.plugins error";
        }
    }
};

auto
deployment_category() -> const std::error_category& {
    static deployment_category_t instance;
    return instance;
}

auto
descriptor_category() -> const std::error_category& {
    static descriptor_category_t instance;
    return instance;
}

auto
repository_category() -> const std::error_category& {
    static repository_category_t instance;
    return instance;
}

} // namespace

namespace enclave { namespace error {

auto
make_error_code(deployment_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), deployment_category());
}

auto
make_error_code(descriptor_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), descriptor_category());
}

auto
make_error_code(repository_errors code) -> std::error_code {
    return std::error_code(static_cast<int>(code), repository_category());
}

deployment_error_t::deployment_error_t(deployment_errors code, std::string application,
                                       const std::string& reason):
    std::system_error(make_error_code(code), format("application '{}': {}", application, reason)),
    m_application(std::move(application))
{ }

std::string
to_string(const std::system_error& e) {
    return enclave::format("[{}] {}", e.code().value(), e.what());
}

std::string
root_cause(const std::exception& e) {
    try {
        std::rethrow_if_nested(e);
    } catch(const std::exception& nested) {
        return root_cause(nested);
    } catch(...) {
        return "unknown error";
    }

    return e.what();
}

const std::error_code
error_t::kInvalidArgumentErrorCode = std::make_error_code(std::errc::invalid_argument);

}} // namespace enclave::error
