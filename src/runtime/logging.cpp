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


#include "enclave/detail/runtime/logging.hpp"

#include <blackhole/record.hpp>
#include <blackhole/sink.hpp>
#include <blackhole/sink/console.hpp>
#include <blackhole/termcolor.hpp>

namespace blackhole {

factory<enclave::logging::console_t>::factory(const enclave::config_t::logging_t& config):
    m_stderr(config.console() == "stderr"),
    m_colored(config.colored())
{ }

auto
factory<enclave::logging::console_t>::type() const noexcept -> const char* {
    return "console";
}

auto
factory<enclave::logging::console_t>::from(const config::node_t&) const -> std::unique_ptr<sink_t> {
    auto builder = blackhole::builder<blackhole::sink::console_t>();

    if(m_stderr) {
        builder.stderr();
    } else {
        builder.stdout();
    }

    // Only problems stand out, routine records stay uncolored.
    if(m_colored) {
        builder
            .colorize(enclave::logging::warning, termcolor_t::yellow())
            .colorize(enclave::logging::error, termcolor_t::red());
    }

    return std::move(builder).build();
}

}  // namespace blackhole
