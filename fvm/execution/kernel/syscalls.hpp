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
#include <fvm/execution/types.hpp>
#include <fvm/vm/module.hpp>

#include <cstdint>
#include <span>

FVM_NAMESPACE_BEGIN

/// Syscall ids as encoded in SYSCALL immediates. The high byte is the
/// group. Pointer arguments are offsets into the caller's linear memory;
/// hashes and token amounts are 32 byte big endian.
enum class Syscall : uint16_t
{
    // message
    CALLER = 0x0000, // () -> (id)
    RECEIVER = 0x0001, // () -> (id)
    METHOD_NUMBER = 0x0002, // () -> (method)
    VALUE_RECEIVED = 0x0003, // (out) -> ()

    // self
    ROOT = 0x0100, // (out) -> ()
    SET_ROOT = 0x0101, // (hash) -> ()
    CURRENT_BALANCE = 0x0102, // (out) -> ()
    SELF_DESTRUCT = 0x0103, // (beneficiary) -> ()

    // ipld
    BLOCK_OPEN = 0x0200, // (hash) -> (handle, size)
    BLOCK_CREATE = 0x0201, // (ptr, len) -> (handle)
    BLOCK_READ = 0x0202, // (handle, offset, out, len) -> (copied)
    BLOCK_STAT = 0x0203, // (handle) -> (size)
    BLOCK_LINK = 0x0204, // (handle, out) -> ()

    // actor
    GET_ACTOR_CODE_HASH = 0x0300, // (id, out) -> ()
    CREATE_ACTOR = 0x0301, // (id, code_hash) -> ()
    NEXT_ACTOR_ID = 0x0302, // () -> (id)

    // send
    SEND = 0x0400, // (to, method, params, value) -> (exit_code, handle)

    // rand
    GET_CHAIN_RANDOMNESS = 0x0500, // (tag, round, ptr, len, out) -> ()
    GET_BEACON_RANDOMNESS = 0x0501, // (tag, round, ptr, len, out) -> ()

    // crypto
    HASH = 0x0600, // (kind, ptr, len, out) -> ()
    VERIFY = 0x0601, // (kind, ptr, len) -> (valid)

    // gas
    CHARGE_GAS = 0x0700, // (amount) -> ()
    AVAILABLE = 0x0701, // () -> (gas)

    // network
    EPOCH = 0x0800, // () -> (epoch)
    VERSION = 0x0801, // () -> (version)
    BASE_FEE = 0x0802, // (out) -> ()
    CHAIN_ID = 0x0803, // () -> (chain_id)

    // event
    EMIT_EVENT = 0x0900, // (ptr, len) -> ()

    // debug
    LOG = 0x0a00, // (ptr, len) -> ()
};

inline constexpr uint64_t HASH_KECCAK256 = 0;
inline constexpr uint64_t HASH_BLAKE3 = 1;

/// The syscalls guest code may link against under `version`; empty if the
/// version is unsupported.
std::span<vm::SyscallSignature const> syscall_table(NetworkVersion);

FVM_NAMESPACE_END
