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


#ifndef ENCLAVE_BUILDER_API_HPP
#define ENCLAVE_BUILDER_API_HPP

#include "enclave/common.hpp"
#include "enclave/repository.hpp"

namespace enclave { namespace api {

typedef std::map<std::string, std::string> properties_t;

/// Configuration builder: contributes to the configuration of a runtime context.
///
/// Builders run in chain order against the same property set, so a builder can read whatever the
/// previous ones have resolved.
struct builder_t {
    typedef builder_t category_type;

    virtual
   ~builder_t() {
        // Empty.
    }

    /// A self-sufficient builder needs no properties or scanning and is used standalone.
    virtual
    bool
    configured() const {
        return false;
    }

    /// \param loader The application boundary, the explicit resolution context for the builder.
    virtual
    void
    configure(properties_t& properties, const loader_t& loader) = 0;
};

// Builder factories exported by shared objects in an application boundary are looked up by the
// "enclave_builder_<name>" symbol and must have this signature.
typedef builder_t* (*builder_factory_fn_t)(const std::vector<std::string>& args);

template<>
struct category_traits<builder_t> {
    typedef std::unique_ptr<builder_t> ptr_type;

    struct factory_type: public basic_factory<builder_t> {
        virtual
        ptr_type
        get(const std::vector<std::string>& args) = 0;
    };

    template<class T>
    struct default_factory: public factory_type {
        virtual
        ptr_type
        get(const std::vector<std::string>& args) {
            return ptr_type(new T(args));
        }
    };
};

}} // namespace enclave::api

#endif
