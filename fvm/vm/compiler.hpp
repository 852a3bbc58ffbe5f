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
#include <fvm/core/result.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace fvm::vm
{
    struct CompileOptions
    {
        InstructionCosts costs;
        std::span<SyscallSignature const> syscalls;
        uint32_t max_memory_pages;
        size_t max_code_size;
    };

    /// Decode, validate, link and meter a module. Every syscall the code
    /// names must appear in `options.syscalls`, otherwise compilation fails.
    Result<SharedModule>
    compile(byte_string_view code, CompileOptions const &options);
}
