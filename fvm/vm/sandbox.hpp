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

#include <fvm/vm/host.hpp>
#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/status.hpp>

#include <cstdint>
#include <span>
#include <vector>

namespace fvm::vm
{
    struct SandboxLimits
    {
        uint32_t max_memory_pages;
        uint32_t max_stack_depth;
    };

    /// One instantiation of a module, bound to exactly one host. Memory and
    /// the operand stack are owned by the sandbox and released with it.
    class Sandbox
    {
        SharedModule module_;
        Memory memory_;
        std::vector<uint64_t> stack_;
        uint32_t max_stack_depth_;
        MeteringHook meter_;
        Host &host_;

    public:
        Sandbox(
            SharedModule, SandboxLimits const &, MeteringHook meter, Host &);

        Sandbox(Sandbox const &) = delete;
        Sandbox &operator=(Sandbox const &) = delete;

        /// Run from `entry` with `args` on the operand stack, bottom first.
        ExecResult run(uint32_t entry, std::span<uint64_t const> args);

        Memory &memory() noexcept
        {
            return memory_;
        }

    private:
        bool push(uint64_t) noexcept;
    };
}
