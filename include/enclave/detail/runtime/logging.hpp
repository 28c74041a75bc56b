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


#ifndef ENCLAVE_RUNTIME_LOGGING_HPP
#define ENCLAVE_RUNTIME_LOGGING_HPP

#include "enclave/config.hpp"

#include <blackhole/sink.hpp>

namespace enclave { namespace logging {

// Console sink, registered as "console". The output stream and highlighting come from the
// "logging.console" section of the host configuration rather than from the logger definitions.
struct console_t;

}} // namespace enclave::logging

namespace blackhole {
inline namespace v1 {

template<>
class factory<enclave::logging::console_t>:
    public factory<sink_t>
{
    const bool m_stderr;
    const bool m_colored;

public:
    explicit
    factory(const enclave::config_t::logging_t& config);

    auto
    type() const noexcept -> const char* override;

    auto
    from(const config::node_t& config) const -> std::unique_ptr<sink_t> override;
};

}  // namespace v1
}  // namespace blackhole

#endif
