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


#ifndef ENCLAVE_ASSEMBLER_HPP
#define ENCLAVE_ASSEMBLER_HPP

#include "enclave/api/builder.hpp"
#include "enclave/common.hpp"

#include <boost/filesystem/path.hpp>

namespace enclave {

/// Decides which configuration builders an application needs and in which order.
class assembler_t {
    const api::repository_t& m_repository;

public:
    explicit
    assembler_t(const api::repository_t& repository);

    /// Instantiates the primary builder named by the descriptor's selector.
    ///
    /// \throws std::system_error with `component_not_found` code if neither the repository nor the
    ///     application boundary knows the builder.
    std::unique_ptr<api::builder_t>
    primary(const descriptor_t& descriptor, const std::vector<std::string>& resources,
            const api::loader_t& loader) const;

    /// Builds the complete chain, the primary builder being the last one. A self-configured primary
    /// builder makes up the chain alone.
    ///
    /// \param home The application installation directory.
    api::builder_chain_t
    assemble(const descriptor_t& descriptor, const boost::filesystem::path& home,
             const std::vector<std::string>& resources, const api::loader_t& loader) const;
};

} // namespace enclave

#endif
