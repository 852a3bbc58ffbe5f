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

#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>

namespace fvm::vm
{
    inline constexpr size_t MAX_SYSCALL_RESULTS = 4;

    enum class SyscallStatus : uint8_t
    {
        Continue,
        OutOfGas,
        // terminate as if the guest aborted with `values[0]`
        Abort,
        Fatal,
    };

    enum class MemoryGrant : uint8_t
    {
        Granted,
        OutOfGas,
        LimitExceeded,
    };

    /// What a syscall hands back to the sandbox. On `Continue` the first
    /// `num_results` values are pushed, followed by `error` (0 on success).
    struct SyscallResult
    {
        std::array<uint64_t, MAX_SYSCALL_RESULTS> values{};
        uint64_t error{0};
        SyscallStatus status{SyscallStatus::Continue};
    };

    /// The trusted side of the sandbox boundary. One host is bound to each
    /// running sandbox.
    class Host
    {
    public:
        virtual ~Host() = default;

        virtual SyscallResult syscall(
            SyscallSignature const &, std::span<uint64_t const> args,
            Memory &) = 0;

        /// Asked before linear memory grows by `pages`. The host prices
        /// the pages and enforces limits wider than one instance.
        virtual MemoryGrant grow_memory(uint32_t pages) = 0;
    };

    /// Invoked with the static cost of each basic block before it runs.
    /// Returning false terminates the sandbox with out of gas.
    using MeteringHook = std::function<bool(uint64_t)>;
}
