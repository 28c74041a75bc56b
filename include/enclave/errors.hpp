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


#ifndef ENCLAVE_EXCEPTIONS_HPP
#define ENCLAVE_EXCEPTIONS_HPP

#include "enclave/format.hpp"

#include <memory>
#include <system_error>

namespace enclave { namespace error {

// Lifecycle stage failures. Every one of them wraps its root cause as a nested exception.
enum deployment_errors {
    installation_failed = 1,
    domain_not_found,
    initialization_failed,
    start_failed,
    stop_failed,
    already_deployed,
    not_deployed
};

enum descriptor_errors {
    descriptor_unreadable = 1,
    descriptor_malformed,
    invalid_descriptor_value
};

enum repository_errors {
    component_not_found = 1,
    duplicate_component,
    initialization_error,
    invalid_interface,
    dlopen_error,
    version_mismatch
};

auto
make_error_code(deployment_errors code) -> std::error_code;

auto
make_error_code(descriptor_errors code) -> std::error_code;

auto
make_error_code(repository_errors code) -> std::error_code;

// Generic exception

struct error_t:
    public std::system_error
{
    static const std::error_code kInvalidArgumentErrorCode;

    template<class... Args>
    error_t(const std::string& fmt, const Args&... args):
        std::system_error(kInvalidArgumentErrorCode, enclave::format(fmt, args...))
    {}

    template<class... Args>
    error_t(std::error_code ec, const std::string& fmt, const Args&... args):
        std::system_error(std::move(ec), enclave::format(fmt, args...))
    {}

    template<class E, class... Args, class = typename std::enable_if<
        std::is_error_code_enum<E>::value || std::is_error_condition_enum<E>::value
    >::type>
    error_t(const E err, const std::string& fmt, const Args&... args):
        std::system_error(make_error_code(err), enclave::format(fmt, args...))
    {}
};

/// Stage-specific lifecycle failure.
///
/// Thrown via `std::throw_with_nested()`, so the original exception can be recovered with
/// `std::rethrow_if_nested()` or summarized with `root_cause()`.
class deployment_error_t:
    public std::system_error
{
    std::string m_application;

public:
    deployment_error_t(deployment_errors code, std::string application, const std::string& reason);

    const std::string&
    application() const noexcept {
        return m_application;
    }
};

std::string
to_string(const std::system_error& e);

/// Walks the chain of nested exceptions and returns the message of the innermost one.
std::string
root_cause(const std::exception& e);

} // namespace error

using error::error_t;

} // namespace enclave

namespace std {

template<>
struct is_error_code_enum<enclave::error::deployment_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<enclave::error::descriptor_errors>:
    public true_type
{ };

template<>
struct is_error_code_enum<enclave::error::repository_errors>:
    public true_type
{ };

} // namespace std

#endif
