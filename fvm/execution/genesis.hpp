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

#include <fvm/core/bytes.hpp>
#include <fvm/core/config.hpp>
#include <fvm/core/result.hpp>
#include <fvm/execution/state/blockstore.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>
#include <string_view>

FVM_NAMESPACE_BEGIN

enum class GenesisError
{
    Success = 0,
    InvalidDocument,
    InvalidActorId,
    InvalidBalance,
    InvalidSequence,
    InvalidCode,
};

/// Builds the initial state tree from an allocation document
///
///   {"<actor id>": {"balance": "<decimal or 0x hex>",
///                   "sequence": <n>, "code": "0x<module bytes>"}}
///
/// where "sequence" and "code" are optional. Code is written to `store`.
/// Returns the state root.
Result<bytes32_t> load_genesis_state(std::string_view, Blockstore &);

FVM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fvm::GenesisError>
    : quick_status_code_from_enum_defaults<fvm::GenesisError>
{
    static constexpr auto const domain_name = "Genesis Error";
    static constexpr auto const domain_uuid =
        "9a3c7e15-0b64-4f28-b1d9-6c5e2a8f0d37";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
