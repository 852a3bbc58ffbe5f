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

#include <fvm/core/config.hpp>
#include <fvm/execution/kernel/syscalls.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/module.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

FVM_ANONYMOUS_NAMESPACE_BEGIN

constexpr vm::SyscallSignature
sig(Syscall const id, uint8_t const args, uint8_t const results,
    std::string_view const name)
{
    return {static_cast<uint16_t>(id), args, results, name};
}

constexpr std::array V1_SYSCALLS{
    sig(Syscall::CALLER, 0, 1, "message::caller"),
    sig(Syscall::RECEIVER, 0, 1, "message::receiver"),
    sig(Syscall::METHOD_NUMBER, 0, 1, "message::method_number"),
    sig(Syscall::VALUE_RECEIVED, 1, 0, "message::value_received"),
    sig(Syscall::ROOT, 1, 0, "self::root"),
    sig(Syscall::SET_ROOT, 1, 0, "self::set_root"),
    sig(Syscall::CURRENT_BALANCE, 1, 0, "self::current_balance"),
    sig(Syscall::SELF_DESTRUCT, 1, 0, "self::self_destruct"),
    sig(Syscall::BLOCK_OPEN, 1, 2, "ipld::block_open"),
    sig(Syscall::BLOCK_CREATE, 2, 1, "ipld::block_create"),
    sig(Syscall::BLOCK_READ, 4, 1, "ipld::block_read"),
    sig(Syscall::BLOCK_STAT, 1, 1, "ipld::block_stat"),
    sig(Syscall::BLOCK_LINK, 2, 0, "ipld::block_link"),
    sig(Syscall::GET_ACTOR_CODE_HASH, 2, 0, "actor::get_actor_code_hash"),
    sig(Syscall::CREATE_ACTOR, 2, 0, "actor::create_actor"),
    sig(Syscall::NEXT_ACTOR_ID, 0, 1, "actor::next_actor_id"),
    sig(Syscall::SEND, 4, 2, "send::send"),
    sig(Syscall::GET_CHAIN_RANDOMNESS, 5, 0, "rand::get_chain_randomness"),
    sig(Syscall::HASH, 4, 0, "crypto::hash"),
    sig(Syscall::VERIFY, 3, 1, "crypto::verify"),
    sig(Syscall::CHARGE_GAS, 1, 0, "gas::charge_gas"),
    sig(Syscall::AVAILABLE, 0, 1, "gas::available"),
    sig(Syscall::EPOCH, 0, 1, "network::epoch"),
    sig(Syscall::VERSION, 0, 1, "network::version"),
    sig(Syscall::BASE_FEE, 1, 0, "network::base_fee"),
    sig(Syscall::EMIT_EVENT, 2, 0, "event::emit_event"),
    sig(Syscall::LOG, 2, 0, "debug::log"),
};

constexpr std::array V2_ADDITIONS{
    sig(Syscall::GET_BEACON_RANDOMNESS, 5, 0, "rand::get_beacon_randomness"),
    sig(Syscall::CHAIN_ID, 0, 1, "network::chain_id"),
};

template <size_t N, size_t M>
constexpr std::array<vm::SyscallSignature, N + M> concat(
    std::array<vm::SyscallSignature, N> const &a,
    std::array<vm::SyscallSignature, M> const &b)
{
    std::array<vm::SyscallSignature, N + M> out{};
    for (size_t i = 0; i < N; ++i) {
        out[i] = a[i];
    }
    for (size_t i = 0; i < M; ++i) {
        out[N + i] = b[i];
    }
    return out;
}

constexpr auto V2_SYSCALLS = concat(V1_SYSCALLS, V2_ADDITIONS);

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

std::span<vm::SyscallSignature const>
syscall_table(NetworkVersion const version)
{
    switch (version) {
    case NetworkVersion::V1:
        return V1_SYSCALLS;
    case NetworkVersion::V2:
        return V2_SYSCALLS;
    }
    return {};
}

FVM_NAMESPACE_END
