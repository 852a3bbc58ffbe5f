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
#include <fvm/core/config.hpp>
#include <fvm/core/result.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/gas/gas_charge.hpp>
#include <fvm/execution/kernel/block_registry.hpp>
#include <fvm/execution/kernel/syscalls.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/host.hpp>
#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <span>

FVM_NAMESPACE_BEGIN

class CallManager;

/// Host side of one frame. Guest code reaches state, other actors and the
/// chain only through `syscall`.
class Kernel final : public vm::Host
{
    using Args = std::span<uint64_t const>;
    using Values = std::array<uint64_t, vm::MAX_SYSCALL_RESULTS>;

    CallManager &call_manager_;
    ActorID caller_;
    ActorID receiver_;
    MethodNum method_;
    TokenAmount value_;
    BlockRegistry blocks_;
    BlockHandle params_{NO_BLOCK};
    uint32_t memory_pages_{0};
    std::optional<ExitCode> forced_exit_{};
    Result<void> fatal_{outcome::success()};

    Result<void> charge(GasCharge const &);

    Result<ActorState> self_state();

    Result<Values> dispatch(Syscall, Args, vm::Memory &);

    // message
    Result<Values> value_received(Args, vm::Memory &);

    // self
    Result<Values> root(Args, vm::Memory &);
    Result<Values> set_root(Args, vm::Memory &);
    Result<Values> current_balance(Args, vm::Memory &);
    Result<Values> self_destruct(Args);

    // ipld
    Result<Values> block_open(Args, vm::Memory &);
    Result<Values> block_create(Args, vm::Memory &);
    Result<Values> block_read(Args, vm::Memory &);
    Result<Values> block_stat(Args);
    Result<Values> block_link(Args, vm::Memory &);

    // actor
    Result<Values> get_actor_code_hash(Args, vm::Memory &);
    Result<Values> create_actor(Args, vm::Memory &);

    Result<Values> send(Args, vm::Memory &);

    Result<Values> get_randomness(Syscall, Args, vm::Memory &);

    // crypto
    Result<Values> hash(Args, vm::Memory &);
    Result<Values> verify(Args, vm::Memory &);

    Result<Values> emit_event(Args, vm::Memory &);

    Result<Values> log(Args, vm::Memory &);

public:
    Kernel(
        CallManager &, ActorID caller, ActorID receiver, MethodNum,
        TokenAmount const &value, byte_string_view params);

    Kernel(Kernel const &) = delete;
    Kernel &operator=(Kernel const &) = delete;

    /// Returns the frame's memory pages to the message.
    ~Kernel() override;

    vm::SyscallResult syscall(
        vm::SyscallSignature const &, std::span<uint64_t const> args,
        vm::Memory &) override;

    vm::MemoryGrant grow_memory(uint32_t pages) override;

    /// Handle of the parameters block, NO_BLOCK if there are none.
    BlockHandle params_handle() const noexcept
    {
        return params_;
    }

    /// Exit code imposed by the host when it terminated the sandbox.
    std::optional<ExitCode> forced_exit() const noexcept
    {
        return forced_exit_;
    }

    /// The error that made a syscall return `SyscallStatus::Fatal`.
    Result<void> take_fatal();
};

FVM_NAMESPACE_END
