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


#ifndef ENCLAVE_DIRECTORY_LOADER_HPP
#define ENCLAVE_DIRECTORY_LOADER_HPP

#include "enclave/api/loader.hpp"
#include "enclave/locked_ptr.hpp"

#include <atomic>

namespace enclave { namespace isolation {

/// Boundary backed by a directory.
///
/// Resources are files below the directory, symbols come from the shared objects found in the
/// libraries directory, each one opened with RTLD_LOCAL so that its symbols never leak into the
/// global namespace of the process.
class directory_t:
    public api::loader_t
{
public:
    enum scope_t {
        // Only the shared objects of this boundary.
        local,
        // Additionally everything which is already loaded into the process.
        process
    };

private:
    struct dlclose_action_t {
        void
        operator()(void* handle) const;
    };

    typedef std::unique_ptr<void, dlclose_action_t> handle_type;

    const std::unique_ptr<logging::logger_t> m_log;

    const std::string m_name;
    const boost::filesystem::path m_root;
    const scope_t m_scope;

    synchronized<std::vector<handle_type>> m_handles;
    std::atomic<bool> m_closed;

public:
    directory_t(std::unique_ptr<logging::logger_t> log,
                std::string name,
                const boost::filesystem::path& root,
                const boost::filesystem::path& libraries,
                ptr_type parent,
                scope_t scope = local);

    virtual
   ~directory_t();

    virtual
    std::string
    name() const {
        return m_name;
    }

    const boost::filesystem::path&
    root() const {
        return m_root;
    }

    virtual
    void
    close();

    virtual
    bool
    closed() const {
        return m_closed;
    }

protected:
    virtual
    boost::optional<boost::filesystem::path>
    find_resource(const std::string& name) const;

    virtual
    void*
    find_symbol(const std::string& name) const;

private:
    void
    open(const boost::filesystem::path& target);
};

}} // namespace enclave::isolation

#endif
