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


#ifndef ENCLAVE_LOGGING_HPP
#define ENCLAVE_LOGGING_HPP

#include "enclave/common.hpp"
#include "enclave/format.hpp"

#include <typeinfo>

#include <blackhole/attribute.hpp>
#include <blackhole/attributes.hpp>
#include <blackhole/extensions/facade.hpp>
#include <blackhole/logger.hpp>

#define ENCLAVE_LOG(__log__, __severity__, ...) \
    ::enclave::detail::logging::log(__log__, __severity__, __VA_ARGS__)

#define ENCLAVE_LOG_DEBUG(__log__, ...) \
    ENCLAVE_LOG(__log__, ::enclave::logging::debug, __VA_ARGS__)

#define ENCLAVE_LOG_INFO(__log__, ...) \
    ENCLAVE_LOG(__log__, ::enclave::logging::info, __VA_ARGS__)

#define ENCLAVE_LOG_WARNING(__log__, ...) \
    ENCLAVE_LOG(__log__, ::enclave::logging::warning, __VA_ARGS__)

#define ENCLAVE_LOG_ERROR(__log__, ...) \
    ENCLAVE_LOG(__log__, ::enclave::logging::error, __VA_ARGS__)

namespace enclave { namespace detail { namespace logging {

template<typename T> inline auto logger_ref(T& log) -> T& { return log; }
template<typename T> inline auto logger_ref(T* const log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::unique_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(std::shared_ptr<T>& log) -> T& { return *log; }
template<typename T> inline auto logger_ref(const std::shared_ptr<T>& log) -> T& { return *log; }

template<typename T>
auto
make_facade(T&& log) -> blackhole::logger_facade<enclave::logging::logger_t> {
    return blackhole::logger_facade<enclave::logging::logger_t>(logger_ref(log));
}

template<typename Log, typename Message>
auto
log(Log&& log, enclave::logging::priorities severity, Message&& message, const blackhole::attribute_list& attributes) -> void {
    make_facade(log).log(severity, std::forward<Message>(message), attributes);
}

template<typename Log, typename Message, typename... Args>
auto
log(Log&& log, enclave::logging::priorities severity, Message&& message, const Args&... args) -> void {
    make_facade(log).log(severity, std::forward<Message>(message), args...);
}

}}}  // namespace enclave::detail::logging

namespace enclave { namespace logging {

// C++ typename demangling
auto
demangle(const std::string& mangled) -> std::string;

template<class T>
auto
demangle() -> std::string {
    return demangle(typeid(T).name());
}

// Diagnostic identity of an object in the "<implementation>[<name>]@<address>" form.
auto
identity(const std::type_info& type, const std::string& name, const void* address) -> std::string;

}}  // namespace enclave::logging

#endif
