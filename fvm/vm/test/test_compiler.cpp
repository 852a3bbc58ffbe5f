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

#include <fvm/core/byte_string.hpp>
#include <fvm/vm/compile_error.hpp>
#include <fvm/vm/compiler.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>
#include <fvm/vm/utils/assembler.hpp>

#include <gtest/gtest.h>

#include <array>
#include <limits>

using namespace fvm;
using namespace fvm::vm;
using fvm::vm::utils::Assembler;

namespace
{
    constexpr std::array<SyscallSignature, 1> syscalls{
        {{.id = 7, .num_args = 1, .num_results = 1, .name = "echo"}}};

    CompileOptions const options{
        .costs =
            {.basic = 1,
             .memory = 2,
             .control = 3,
             .syscall = 0},
        .syscalls = syscalls,
        .max_memory_pages = 4,
        .max_code_size = 1024};
}

TEST(Compiler, valid_module)
{
    auto const code = Assembler{}
                          .export_method(1, "one")
                          .export_method(9, "nine")
                          .label("one")
                          .abort(16)
                          .label("nine")
                          .push(1)
                          .syscall(7)
                          .ret(0, 0)
                          .build();

    auto const result = compile(code, options);
    ASSERT_FALSE(result.has_error());
    auto const &module = result.value();
    EXPECT_EQ(module->entry_point(1), 0u);
    EXPECT_EQ(module->entry_point(9), 3u);
    EXPECT_FALSE(module->entry_point(2).has_value());
    ASSERT_NE(module->syscall(7), nullptr);
    EXPECT_EQ(module->syscall(7)->name, "echo");
    EXPECT_EQ(module->syscall(8), nullptr);
}

TEST(Compiler, block_costs_summed_per_block)
{
    // PUSH1 PUSH1 ADD JUMPI | PUSH1 ABORT | PUSH1 ABORT
    auto const code = Assembler{}
                          .export_method(1, "start")
                          .label("start")
                          .push(1)
                          .push(2)
                          .ins(ADD)
                          .jumpi("taken")
                          .abort(16)
                          .label("taken")
                          .abort(17)
                          .build();

    auto const result = compile(code, options);
    ASSERT_FALSE(result.has_error());
    auto const &module = result.value();

    ASSERT_TRUE(module->is_block_start(0));
    EXPECT_EQ(module->block_cost(0), 1 + 1 + 1 + 3);
    EXPECT_FALSE(module->is_block_start(2));
    ASSERT_TRUE(module->is_block_start(10));
    EXPECT_EQ(module->block_cost(10), 1 + 3);
    ASSERT_TRUE(module->is_block_start(13));
    EXPECT_EQ(module->block_cost(13), 1 + 3);
}

TEST(Compiler, bad_header)
{
    auto code = Assembler{}.abort(16).build();
    code[0] = 'X';
    EXPECT_EQ(compile(code, options).error(), CompileError::BadMagic);

    code = Assembler{}.abort(16).build();
    code[4] = MODULE_VERSION + 1;
    EXPECT_EQ(compile(code, options).error(), CompileError::UnsupportedVersion);

    code = Assembler{}.abort(16).build();
    code.resize(code.size() - 1);
    EXPECT_EQ(compile(code, options).error(), CompileError::Truncated);

    code = Assembler{}.abort(16).build();
    code.push_back(0);
    EXPECT_EQ(compile(code, options).error(), CompileError::TrailingBytes);
}

TEST(Compiler, memory_limits)
{
    auto code = Assembler{}.memory(1, 5).build();
    EXPECT_EQ(
        compile(code, options).error(), CompileError::MemoryLimitExceeded);

    code = Assembler{}.memory(2, 1).build();
    EXPECT_EQ(
        compile(code, options).error(), CompileError::MemoryLimitExceeded);

    code = Assembler{}.memory(0, 1).data(byte_string{1, 2, 3}).build();
    EXPECT_EQ(
        compile(code, options).error(), CompileError::DataSegmentTooLarge);
}

TEST(Compiler, code_too_large)
{
    Assembler a;
    for (int i = 0; i < 1025; ++i) {
        a.ins(NOP);
    }
    EXPECT_EQ(compile(a.build(), options).error(), CompileError::CodeTooLarge);
}

TEST(Compiler, rejects_float_and_unknown_opcodes)
{
    auto code = Assembler{}.raw(FLOAT_OPCODE_FIRST).build();
    EXPECT_EQ(
        compile(code, options).error(),
        CompileError::NondeterministicInstruction);

    code = Assembler{}.raw(FLOAT_OPCODE_LAST).build();
    EXPECT_EQ(
        compile(code, options).error(),
        CompileError::NondeterministicInstruction);

    code = Assembler{}.raw(0xFF).build();
    EXPECT_EQ(compile(code, options).error(), CompileError::IllegalInstruction);
}

TEST(Compiler, truncated_immediate)
{
    auto const code = Assembler{}.raw(PUSH8).raw(1).raw(2).build();
    EXPECT_EQ(compile(code, options).error(), CompileError::TruncatedImmediate);
}

TEST(Compiler, invalid_jump_target)
{
    // offset 1 is the immediate of PUSH1
    auto code = Assembler{}.push(5).jump_to(1).build();
    EXPECT_EQ(compile(code, options).error(), CompileError::InvalidJumpTarget);

    code = Assembler{}.jump_to(std::numeric_limits<uint32_t>::max()).build();
    EXPECT_EQ(compile(code, options).error(), CompileError::InvalidJumpTarget);
}

TEST(Compiler, unknown_syscall)
{
    auto const code = Assembler{}.syscall(8).build();
    EXPECT_EQ(compile(code, options).error(), CompileError::UnknownSyscall);
}

TEST(Compiler, invalid_exports)
{
    auto code = Assembler{}
                    .export_method(1, "a")
                    .export_method(1, "b")
                    .label("a")
                    .ins(NOP)
                    .label("b")
                    .ins(NOP)
                    .build();
    EXPECT_EQ(compile(code, options).error(), CompileError::InvalidExport);

    // export past the end of the code
    code = Assembler{}.export_method(1, "end").push(3).label("end").build();
    EXPECT_EQ(compile(code, options).error(), CompileError::InvalidExport);
}
