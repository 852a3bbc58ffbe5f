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
#include <fvm/core/bytes.hpp>
#include <fvm/core/config.hpp>
#include <fvm/core/result.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/gas/gas_tracker.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/host.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

class Machine;

struct InvocationResult
{
    ExitCode exit_code{ExitCode::OK};
    byte_string return_data{};
};

/// Owns the call stack and the gas pool of one message. Every frame runs
/// inside a state checkpoint that is committed only if the frame exits
/// with `ExitCode::OK`.
class CallManager
{
    Machine &machine_;
    GasTracker gas_;
    uint32_t depth_{0};
    uint32_t memory_pages_{0};
    bool unwinding_{false};

    Result<InvocationResult> invoke(
        ActorID from, ActorID to, MethodNum, byte_string_view params,
        TokenAmount const &value);

    Result<InvocationResult>
    transfer(ActorID from, ActorID to, TokenAmount const &value);

    Result<InvocationResult> run(
        ActorID from, ActorID to, MethodNum, byte_string_view params,
        TokenAmount const &value, bytes32_t const &code_hash);

public:
    CallManager(Machine &, uint64_t gas_limit);

    CallManager(CallManager const &) = delete;
    CallManager &operator=(CallManager const &) = delete;

    /// Errors are fatal to the message; everything the actors can cause is
    /// reported through the exit code.
    Result<InvocationResult> send(
        ActorID from, ActorID to, MethodNum, byte_string_view params,
        TokenAmount const &value);

    Machine &machine() noexcept
    {
        return machine_;
    }

    GasTracker &gas() noexcept
    {
        return gas_;
    }

    /// Charge for `pages` of linear memory and count them against the
    /// limit of the whole message. Nothing is charged unless granted.
    vm::MemoryGrant reserve_memory(uint32_t pages);

    void release_memory(uint32_t pages) noexcept;

    /// Pages held by every live instance of this message.
    uint32_t memory_pages() const noexcept
    {
        return memory_pages_;
    }

    uint32_t depth() const noexcept
    {
        return depth_;
    }

    /// Set once a depth violation must abort every open frame.
    bool unwinding() const noexcept
    {
        return unwinding_;
    }
};

FVM_NAMESPACE_END
