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

#include <fvm/core/byte_string.hpp>

#include <cstdint>

namespace fvm::vm
{
    enum class StatusCode : uint8_t
    {
        Success,
        Abort,
        OutOfGas,
        StackOverflow,
        StackUnderflow,
        MemoryOutOfBounds,
        MemoryLimitExceeded,
        DivisionByZero,
        HostFailure,
    };

    struct ExecResult
    {
        StatusCode status;
        uint64_t abort_code{0};
        byte_string output{};
    };

    constexpr bool is_fault(StatusCode const status) noexcept
    {
        switch (status) {
        case StatusCode::StackOverflow:
        case StatusCode::StackUnderflow:
        case StatusCode::MemoryOutOfBounds:
        case StatusCode::MemoryLimitExceeded:
        case StatusCode::DivisionByZero:
            return true;
        default:
            return false;
        }
    }
}
