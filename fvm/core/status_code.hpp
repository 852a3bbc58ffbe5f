// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <fvm/core/config.hpp>
#include <fvm/core/result.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <optional>

FVM_NAMESPACE_BEGIN

/// Recovers the enumerator behind a type erased status code, if the code
/// belongs to the domain of `Enum`.
template <class Enum, class Code>
std::optional<Enum> error_value(Code const &code)
{
    using Mapping =
        BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE::quick_status_code_from_enum<Enum>;
    for (auto const &mapping : Mapping::value_mappings()) {
        if (code == mapping.value) {
            return mapping.value;
        }
    }
    return std::nullopt;
}

FVM_NAMESPACE_END
