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
#include <fvm/execution/gas/gas_charge.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/opcodes.hpp>

#include <array>
#include <cstddef>
#include <cstdint>

FVM_NAMESPACE_BEGIN

struct ScalingCost
{
    uint64_t flat;
    uint64_t per_byte;

    constexpr uint64_t apply(size_t const size) const noexcept
    {
        return flat + per_byte * size;
    }
};

enum class VerifyKind : uint64_t
{
    Signature = 0,
    Proof = 1,
};

inline constexpr size_t NUM_VERIFY_KINDS = 2;

/// Gas schedule of one network version. Every method is a pure function
/// of its arguments.
struct PriceList
{
    vm::InstructionCosts instructions;
    uint64_t syscall;
    uint64_t memory_page;
    ScalingCost chain_message;
    ScalingCost block_open;
    ScalingCost block_read;
    ScalingCost block_create;
    ScalingCost block_link;
    uint64_t set_root;
    uint64_t create_actor;
    uint64_t actor_lookup;
    uint64_t send_base;
    uint64_t send_transfer_funds;
    uint64_t self_destruct;
    ScalingCost hash;
    std::array<ScalingCost, NUM_VERIFY_KINDS> verify;
    ScalingCost randomness;
    ScalingCost emit_event;

    GasCharge on_instruction(vm::InstructionClass const cls) const noexcept
    {
        return {"exec_instruction", instructions.of(cls)};
    }

    GasCharge on_memory_grow(uint64_t const pages) const noexcept
    {
        return {"memory_grow", memory_page * pages};
    }

    GasCharge on_syscall() const noexcept
    {
        return {"syscall", syscall};
    }

    GasCharge on_chain_message(size_t const size) const noexcept
    {
        return {"on_chain_message", chain_message.apply(size)};
    }

    GasCharge on_block_open(size_t const size) const noexcept
    {
        return {"block_open", block_open.apply(size)};
    }

    GasCharge on_block_read(size_t const size) const noexcept
    {
        return {"block_read", block_read.apply(size)};
    }

    GasCharge on_block_create(size_t const size) const noexcept
    {
        return {"block_create", block_create.apply(size)};
    }

    GasCharge on_block_link(size_t const size) const noexcept
    {
        return {"block_link", block_link.apply(size)};
    }

    GasCharge on_set_root() const noexcept
    {
        return {"set_root", set_root};
    }

    GasCharge on_create_actor() const noexcept
    {
        return {"create_actor", create_actor};
    }

    GasCharge on_actor_lookup() const noexcept
    {
        return {"actor_lookup", actor_lookup};
    }

    GasCharge on_method_invocation(
        TokenAmount const &value, MethodNum const method) const noexcept
    {
        uint64_t amount = send_base;
        if (value != 0) {
            amount += send_transfer_funds;
        }
        return {method == METHOD_SEND ? "send_transfer" : "send_invoke",
                amount};
    }

    GasCharge on_self_destruct() const noexcept
    {
        return {"self_destruct", self_destruct};
    }

    GasCharge on_hash(size_t const size) const noexcept
    {
        return {"hash", hash.apply(size)};
    }

    GasCharge on_verify(VerifyKind const kind, size_t const size) const noexcept
    {
        return {"verify", verify[static_cast<size_t>(kind)].apply(size)};
    }

    GasCharge on_get_randomness(size_t const entropy_size) const noexcept
    {
        return {"get_randomness", randomness.apply(entropy_size)};
    }

    GasCharge on_emit_event(size_t const size) const noexcept
    {
        return {"emit_event", emit_event.apply(size)};
    }
};

/// nullptr if the version has no schedule.
PriceList const *price_list_by_version(NetworkVersion);

FVM_NAMESPACE_END
