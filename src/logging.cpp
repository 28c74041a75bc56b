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


#include "enclave/logging.hpp"

#include <cxxabi.h>

#include <cstdlib>
#include <functional>
#include <memory>

#include "enclave/format.hpp"

namespace enclave { namespace logging {

std::string
demangle(const std::string& mangled) {
    auto deleter = std::bind(&::free, std::placeholders::_1);
    auto status = 0;

    std::unique_ptr<char[], decltype(deleter)> buffer(
        abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status),
        deleter
    );

    // Fall back to the raw symbol, it is still good enough to tell implementations apart.
    if(status != 0) {
        return mangled;
    }

    return buffer.get();
}

std::string
identity(const std::type_info& type, const std::string& name, const void* address) {
    return enclave::format("{}[{}]@{:x}", demangle(type.name()), name,
        reinterpret_cast<std::uintptr_t>(address));
}

}} // namespace enclave::logging
