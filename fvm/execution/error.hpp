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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>

FVM_NAMESPACE_BEGIN

/// Recoverable syscall failures. The value is what guest code sees in the
/// errno word.
enum class ErrorNumber : uint32_t
{
    Success = 0,
    IllegalArgument = 1,
    IllegalOperation = 2,
    LimitExceeded = 3,
    AssertionFailed = 4,
    InsufficientFunds = 5,
    NotFound = 6,
    InvalidHandle = 7,
    Forbidden = 11,
    BufferTooSmall = 12,
};

/// Failures that end a frame (`OutOfGas`) or the whole message (the rest).
enum class ExecutionError
{
    Success = 0,
    OutOfGas,
    MissingBlock,
    MissingActor,
    CorruptState,
    OracleFailure,
};

FVM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<fvm::ErrorNumber>
    : quick_status_code_from_enum_defaults<fvm::ErrorNumber>
{
    static constexpr auto const domain_name = "Syscall Error";
    static constexpr auto const domain_uuid =
        "6e2b9d41-77c3-4a0f-b58e-1d9a0c3f4e25";

    static std::initializer_list<mapping> const &value_mappings();
};

template <>
struct quick_status_code_from_enum<fvm::ExecutionError>
    : quick_status_code_from_enum_defaults<fvm::ExecutionError>
{
    static constexpr auto const domain_name = "Execution Error";
    static constexpr auto const domain_uuid =
        "c81f04a7-2d5e-4b93-8f61-9e3a7b20d5c4";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
