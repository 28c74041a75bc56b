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


#include "enclave/detail/essentials.hpp"

#include "enclave/detail/builder/json.hpp"
#include "enclave/detail/builder/scanner.hpp"
#include "enclave/detail/builder/void.hpp"

void
enclave::essentials::initialize(api::repository_t& repository) {
    repository.insert<builder::auto_t>("auto");
    repository.insert<builder::json_t>("json");
    repository.insert<builder::scanner_t>("scanner");
    repository.insert<builder::void_t>("void");
}
