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


#ifndef ENCLAVE_LOADER_API_HPP
#define ENCLAVE_LOADER_API_HPP

#include "enclave/common.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/optional/optional.hpp>

namespace enclave { namespace api {

/// Isolation boundary: a resource and symbol resolution scope.
///
/// Boundaries form a chain (application -> domain -> host). Lookups search the boundary itself
/// first and then delegate to its parent, so anything private to one application boundary is
/// invisible to its siblings while everything in their shared domain resolves the same way for all
/// of them.
///
/// A boundary holds OS handles (loaded shared objects). They are released by an explicit call to
/// `close()` which must happen before the last reference is dropped.
struct loader_t {
    typedef std::shared_ptr<loader_t> ptr_type;

    virtual
   ~loader_t() {
        // Empty.
    }

    virtual
    std::string
    name() const = 0;

    const ptr_type&
    parent() const {
        return m_parent;
    }

    /// Resolves a resource by its relative name, returning its absolute path.
    boost::optional<boost::filesystem::path>
    resource(const std::string& name) const;

    /// Resolves an exported symbol, returns nullptr if nothing in the chain exports it.
    void*
    symbol(const std::string& name) const;

    /// Resolves an exported function of the specified type.
    template<class Function>
    Function
    function(const std::string& name) const {
        // See the repository plugin loader on why the union is used instead of a cast.
        union { void* ptr; Function call; } target;

        target.ptr = symbol(name);

        return target.ptr ? target.call : nullptr;
    }

    virtual
    void
    close() = 0;

    virtual
    bool
    closed() const = 0;

protected:
    explicit
    loader_t(ptr_type parent):
        m_parent(std::move(parent))
    { }

    virtual
    boost::optional<boost::filesystem::path>
    find_resource(const std::string& name) const = 0;

    virtual
    void*
    find_symbol(const std::string& name) const = 0;

private:
    const ptr_type m_parent;
};

}} // namespace enclave::api

#endif
