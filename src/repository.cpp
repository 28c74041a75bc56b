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


#include "enclave/repository.hpp"

#include "enclave/logging.hpp"

#include <algorithm>

#include <boost/filesystem/convenience.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/iterator/filter_iterator.hpp>

#include <dlfcn.h>

namespace fs = boost::filesystem;

namespace enclave { namespace api {

namespace {

struct is_enclave_plugin_t {
    template<typename T>
    bool
    operator()(const T& entry) const {
        // Strip the path from its platform-dependent extension and make sure that the
        // remaining extension matches "enclave-plugin".
        // An example path on Linux: "/usr/lib/enclave/plugin-name.enclave-plugin.so".
        return fs::is_regular_file(entry) &&
               entry.path().filename().replace_extension().extension() == ".enclave-plugin";
    }
};

// Plugin preconditions validation function type.
typedef preconditions_t (*validation_fn_t)();

// Plugin initialization function type.
typedef void (*initialize_fn_t)(repository_t&);

} // namespace

void
repository_t::dlclose_action_t::operator()(void* plugin) const {
    dlclose(plugin);
}

repository_t::repository_t(std::unique_ptr<logging::logger_t> log):
    m_log(std::move(log))
{ }

repository_t::~repository_t() {
    // Factories may live in the plugins, so they must go away before the plugins are unloaded.
    m_categories.clear();
    m_plugins.clear();
}

void
repository_t::load(const std::vector<std::string>& plugin_dirs) {
    std::vector<std::string> paths;

    for(auto dir = plugin_dirs.begin(); dir != plugin_dirs.end(); ++dir) {
        const auto status = fs::status(*dir);

        if(!fs::exists(status) || !fs::is_directory(status)) {
            ENCLAVE_LOG_WARNING(m_log, "loading plugins: path '{}' is not valid", *dir);
            continue;
        }

        ENCLAVE_LOG_INFO(m_log, "loading plugins from '{}'", *dir);

        typedef boost::filter_iterator<is_enclave_plugin_t, fs::directory_iterator> dir_iterator_t;

        dir_iterator_t begin((is_enclave_plugin_t()), fs::directory_iterator(*dir));
        dir_iterator_t end;

        std::for_each(begin, end, [&](const fs::directory_entry& entry) {
            paths.push_back(entry.path().string());
        });
    }

    // Make sure that we always load plugins in the same order, so that duplicate component names
    // are reported against the same plugin every time.
    std::sort(paths.begin(), paths.end());

    std::for_each(paths.begin(), paths.end(), [this](const std::string& plugin) {
        open(plugin);
    });

    ENCLAVE_LOG_INFO(m_log, "loaded {} plugin(s)", paths.size());
}

void
repository_t::open(const std::string& target) {
    ENCLAVE_LOG_INFO(m_log, "loading '{}' plugin", target);

    // Plugins extend the host itself, so unlike the application boundaries they are global.
    std::unique_ptr<void, dlclose_action_t> plugin(dlopen(target.c_str(), RTLD_GLOBAL | RTLD_NOW));

    if(!plugin) {
        const char* reason = dlerror();
        throw std::system_error(error::dlopen_error, reason ? reason : target);
    }

    // According to the standard, it is neither defined nor undefined to access
    // a non-active member of a union. But GCC explicitly defines this to be
    // okay, so we do it to avoid warnings about type-punned pointer aliasing.

    union { void* ptr; validation_fn_t call; } validation;
    union { void* ptr; initialize_fn_t call; } initialize;

    validation.ptr = dlsym(plugin.get(), "validation");
    initialize.ptr = dlsym(plugin.get(), "initialize");

    if(validation.ptr) {
        const auto preconditions = validation.call();

        if(preconditions.version > ENCLAVE_VERSION) {
            throw std::system_error(error::version_mismatch, target);
        }
    }

    if(!initialize.ptr) {
        throw std::system_error(error::invalid_interface, target);
    }

    try {
        initialize.call(*this);
    } catch(const std::system_error& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to initialize plugin '{}': {}", target, error::to_string(e));
        throw std::system_error(error::initialization_error, target);
    } catch(const std::exception& e) {
        ENCLAVE_LOG_ERROR(m_log, "unable to initialize plugin '{}': {}", target, e.what());
        throw std::system_error(error::initialization_error, target);
    }

    m_plugins.emplace_back(std::move(plugin));
}

void
repository_t::insert(const std::string& id, const std::string& name,
    std::unique_ptr<factory_concept_t> factory)
{
    if(m_categories.count(id) && m_categories.at(id).count(name)) {
        throw std::system_error(error::duplicate_component, name);
    }

    ENCLAVE_LOG_DEBUG(m_log, "registering component '{}' in category '{}'",
        name,
        logging::demangle(id)
    );

    m_categories[id][name] = std::move(factory);
}

}} // namespace enclave::api
