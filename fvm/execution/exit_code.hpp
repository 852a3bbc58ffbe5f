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

#include <cstdint>

FVM_NAMESPACE_BEGIN

/// Outcome of a message or a nested send as observed by its caller. Codes
/// below FIRST_USER_EXIT_CODE are reserved for the system; actors may abort
/// with any code at or above it.
enum class ExitCode : uint32_t
{
    OK = 0,

    SYS_SENDER_INVALID = 1,
    SYS_SENDER_STATE_INVALID = 2,
    SYS_ILLEGAL_INSTRUCTION = 4,
    SYS_INVALID_RECEIVER = 5,
    SYS_INSUFFICIENT_FUNDS = 6,
    SYS_OUT_OF_GAS = 7,
    SYS_ILLEGAL_EXIT_CODE = 9,
    SYS_ASSERTION_FAILED = 10,
    SYS_CALL_DEPTH_EXCEEDED = 12,
    SYS_MEMORY_LIMIT_EXCEEDED = 13,

    USR_ILLEGAL_ARGUMENT = 16,
    USR_NOT_FOUND = 17,
    USR_FORBIDDEN = 18,
    USR_INSUFFICIENT_FUNDS = 19,
    USR_ILLEGAL_STATE = 20,
    USR_SERIALIZATION = 21,
    USR_UNHANDLED_MESSAGE = 22,
    USR_UNSPECIFIED = 23,
    USR_ASSERTION_FAILED = 24,
};

inline constexpr uint32_t FIRST_USER_EXIT_CODE = 16;

constexpr bool is_success(ExitCode const code) noexcept
{
    return code == ExitCode::OK;
}

constexpr bool is_system_error(ExitCode const code) noexcept
{
    auto const value = static_cast<uint32_t>(code);
    return value != 0 && value < FIRST_USER_EXIT_CODE;
}

/// Resource exhaustion, as opposed to a deliberate abort.
constexpr bool is_resource_exhaustion(ExitCode const code) noexcept
{
    return code == ExitCode::SYS_OUT_OF_GAS ||
           code == ExitCode::SYS_CALL_DEPTH_EXCEEDED ||
           code == ExitCode::SYS_MEMORY_LIMIT_EXCEEDED;
}

FVM_NAMESPACE_END
