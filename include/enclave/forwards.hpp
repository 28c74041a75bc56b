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


#ifndef ENCLAVE_FORWARDS_HPP
#define ENCLAVE_FORWARDS_HPP

#include <memory>
#include <vector>

// Third-party forwards

namespace blackhole {
inline namespace v1 {

class logger_t;
class severity_t;

}  // namespace v1
}  // namespace blackhole

namespace enclave {

struct config_t;
struct descriptor_t;

class anchor_t;
class application_t;
class assembler_t;
class deployer_t;
class host_t;
class isolation_t;
class layout_t;
class subscription_t;

} // namespace enclave

namespace enclave { namespace api {

class repository_t;

struct builder_t;
struct context_factory_t;
struct loader_t;
struct resolver_t;
struct runtime_context_t;

typedef std::vector<std::unique_ptr<builder_t>> builder_chain_t;

}} // namespace enclave::api

namespace enclave { namespace monitor {

class scheduler_t;
class watcher_t;
class monitor_t;

}} // namespace enclave::monitor

namespace enclave { namespace logging {

enum priorities: int {
    debug   =  0,
    info    =  1,
    warning =  2,
    error   =  3
};

// Import the logger in our namespace.
using blackhole::logger_t;

}} // namespace enclave::logging

#endif
