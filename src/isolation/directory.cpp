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


#include "enclave/detail/isolation/directory.hpp"

#include "enclave/errors.hpp"
#include "enclave/logging.hpp"

#include <algorithm>

#include <boost/filesystem/convenience.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/iterator/filter_iterator.hpp>

#include <dlfcn.h>

using namespace enclave;
using namespace enclave::isolation;

namespace fs = boost::filesystem;

namespace {

struct is_shared_object_t {
    template<typename T>
    bool
    operator()(const T& entry) const {
        return fs::is_regular_file(entry) && entry.path().extension() == ".so";
    }
};

// Relative names only, and none of them may climb out of the boundary root.
bool
contained(const fs::path& name) {
    if(name.empty() || name.has_root_path()) {
        return false;
    }

    return std::find(name.begin(), name.end(), fs::path("..")) == name.end();
}

} // namespace

void
directory_t::dlclose_action_t::operator()(void* handle) const {
    ::dlclose(handle);
}

directory_t::directory_t(std::unique_ptr<logging::logger_t> log,
                         std::string name,
                         const fs::path& root,
                         const fs::path& libraries,
                         ptr_type parent,
                         scope_t scope):
    loader_t(std::move(parent)),
    m_log(std::move(log)),
    m_name(std::move(name)),
    m_root(root),
    m_scope(scope),
    m_closed(false)
{
    const auto status = fs::status(libraries);

    if(!fs::exists(status) || !fs::is_directory(status)) {
        ENCLAVE_LOG_DEBUG(m_log, "boundary '{}' has no shared objects", m_name);
        return;
    }

    typedef boost::filter_iterator<is_shared_object_t, fs::directory_iterator> dir_iterator_t;

    dir_iterator_t begin((is_shared_object_t()), fs::directory_iterator(libraries));
    dir_iterator_t end;

    std::vector<fs::path> paths;

    std::for_each(begin, end, [&](const fs::directory_entry& entry) {
        paths.push_back(entry.path());
    });

    // Keep the symbol lookup order stable between generations.
    std::sort(paths.begin(), paths.end());

    for(auto it = paths.begin(); it != paths.end(); ++it) {
        open(*it);
    }

    ENCLAVE_LOG_DEBUG(m_log, "boundary '{}' has loaded {} shared object(s)", m_name, paths.size());
}

directory_t::~directory_t() {
    if(!m_closed) {
        ENCLAVE_LOG_WARNING(m_log, "boundary '{}' has not been closed before destruction", m_name);
        close();
    }
}

void
directory_t::open(const fs::path& target) {
    handle_type handle(::dlopen(target.string().c_str(), RTLD_LOCAL | RTLD_NOW), dlclose_action_t());

    if(!handle) {
        const char* reason = ::dlerror();

        throw std::system_error(error::dlopen_error, format("unable to load '{}': {}",
            target.string(), reason ? reason : "unknown error"));
    }

    ENCLAVE_LOG_DEBUG(m_log, "boundary '{}' has loaded '{}'", m_name, target.string());

    m_handles.synchronize()->push_back(std::move(handle));
}

void
directory_t::close() {
    if(m_closed.exchange(true)) {
        return;
    }

    std::vector<handle_type> handles;

    m_handles.synchronize()->swap(handles);

    ENCLAVE_LOG_DEBUG(m_log, "closing boundary '{}', releasing {} handle(s)", m_name, handles.size());

    // Unload in the reverse order.
    while(!handles.empty()) {
        handles.pop_back();
    }
}

boost::optional<fs::path>
directory_t::find_resource(const std::string& name) const {
    if(m_closed || !contained(name)) {
        return boost::none;
    }

    const fs::path path = m_root / name;

    boost::system::error_code ec;

    if(!fs::exists(path, ec)) {
        return boost::none;
    }

    return path;
}

void*
directory_t::find_symbol(const std::string& name) const {
    if(m_closed) {
        return nullptr;
    }

    auto handles = m_handles.synchronize();

    for(auto it = handles->begin(); it != handles->end(); ++it) {
        if(void* ptr = ::dlsym(it->get(), name.c_str())) {
            return ptr;
        }
    }

    if(m_scope == process) {
        return ::dlsym(RTLD_DEFAULT, name.c_str());
    }

    return nullptr;
}
