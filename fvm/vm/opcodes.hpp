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

#include <array>
#include <cstdint>
#include <string_view>

namespace fvm::vm
{
    enum OpCode : uint8_t
    {
        NOP = 0x00,
        PUSH1 = 0x01,
        PUSH4 = 0x02,
        PUSH8 = 0x03,
        POP = 0x04,
        DUP = 0x05,
        SWAP = 0x06,

        ADD = 0x10,
        SUB = 0x11,
        MUL = 0x12,
        DIVU = 0x13,
        REMU = 0x14,
        AND = 0x15,
        OR = 0x16,
        XOR = 0x17,
        SHL = 0x18,
        SHR = 0x19,
        EQ = 0x1A,
        LTU = 0x1B,
        GTU = 0x1C,
        ISZERO = 0x1D,
        NOT = 0x1E,

        JUMP = 0x20,
        JUMPI = 0x21,

        LOAD8 = 0x30,
        LOAD64 = 0x31,
        STORE8 = 0x32,
        STORE64 = 0x33,
        MSIZE = 0x34,
        MGROW = 0x35,

        SYSCALL = 0x40,

        RETURN = 0x50,
        ABORT = 0x51,
    };

    // Reserved for floating point arithmetic, which is not reproducible
    // across hardware and therefore never accepted.
    inline constexpr uint8_t FLOAT_OPCODE_FIRST = 0x60;
    inline constexpr uint8_t FLOAT_OPCODE_LAST = 0x6F;

    constexpr bool is_float_opcode(uint8_t const op) noexcept
    {
        return op >= FLOAT_OPCODE_FIRST && op <= FLOAT_OPCODE_LAST;
    }

    enum class InstructionClass : uint8_t
    {
        Basic,
        Memory,
        Control,
        Syscall,
    };

    struct OpCodeInfo
    {
        std::string_view name;
        uint8_t immediate_size;
        uint8_t min_stack;
        int8_t stack_delta;
        InstructionClass cls;
        bool terminator;
    };

    inline constexpr OpCodeInfo unknown_opcode_info{
        "UNKNOWN", 0, 0, 0, InstructionClass::Basic, false};

    constexpr bool is_unknown_opcode_info(OpCodeInfo const &info) noexcept
    {
        return info.name == unknown_opcode_info.name;
    }

    namespace detail
    {
        constexpr std::array<OpCodeInfo, 256> make_opcode_table()
        {
            using enum InstructionClass;

            std::array<OpCodeInfo, 256> t{};
            t.fill(unknown_opcode_info);

            t[NOP] = {"NOP", 0, 0, 0, Basic, false};
            t[PUSH1] = {"PUSH1", 1, 0, 1, Basic, false};
            t[PUSH4] = {"PUSH4", 4, 0, 1, Basic, false};
            t[PUSH8] = {"PUSH8", 8, 0, 1, Basic, false};
            t[POP] = {"POP", 0, 1, -1, Basic, false};
            // DUP n and SWAP n check their depth at run time
            t[DUP] = {"DUP", 1, 1, 1, Basic, false};
            t[SWAP] = {"SWAP", 1, 2, 0, Basic, false};

            t[ADD] = {"ADD", 0, 2, -1, Basic, false};
            t[SUB] = {"SUB", 0, 2, -1, Basic, false};
            t[MUL] = {"MUL", 0, 2, -1, Basic, false};
            t[DIVU] = {"DIVU", 0, 2, -1, Basic, false};
            t[REMU] = {"REMU", 0, 2, -1, Basic, false};
            t[AND] = {"AND", 0, 2, -1, Basic, false};
            t[OR] = {"OR", 0, 2, -1, Basic, false};
            t[XOR] = {"XOR", 0, 2, -1, Basic, false};
            t[SHL] = {"SHL", 0, 2, -1, Basic, false};
            t[SHR] = {"SHR", 0, 2, -1, Basic, false};
            t[EQ] = {"EQ", 0, 2, -1, Basic, false};
            t[LTU] = {"LTU", 0, 2, -1, Basic, false};
            t[GTU] = {"GTU", 0, 2, -1, Basic, false};
            t[ISZERO] = {"ISZERO", 0, 1, 0, Basic, false};
            t[NOT] = {"NOT", 0, 1, 0, Basic, false};

            t[JUMP] = {"JUMP", 4, 0, 0, Control, true};
            t[JUMPI] = {"JUMPI", 4, 1, -1, Control, true};

            t[LOAD8] = {"LOAD8", 0, 1, 0, Memory, false};
            t[LOAD64] = {"LOAD64", 0, 1, 0, Memory, false};
            t[STORE8] = {"STORE8", 0, 2, -2, Memory, false};
            t[STORE64] = {"STORE64", 0, 2, -2, Memory, false};
            t[MSIZE] = {"MSIZE", 0, 0, 1, Memory, false};
            t[MGROW] = {"MGROW", 0, 1, 0, Memory, false};

            // stack effect depends on the linked syscall signature
            t[SYSCALL] = {"SYSCALL", 2, 0, 0, Syscall, false};

            t[RETURN] = {"RETURN", 0, 2, -2, Control, true};
            t[ABORT] = {"ABORT", 0, 1, -1, Control, true};

            return t;
        }
    }

    inline constexpr std::array<OpCodeInfo, 256> opcode_table =
        detail::make_opcode_table();

    /// Static gas charged per instruction, by class. Block costs are summed
    /// from these at compile time.
    struct InstructionCosts
    {
        uint64_t basic;
        uint64_t memory;
        uint64_t control;
        uint64_t syscall;

        constexpr uint64_t of(InstructionClass const cls) const noexcept
        {
            switch (cls) {
            case InstructionClass::Basic:
                return basic;
            case InstructionClass::Memory:
                return memory;
            case InstructionClass::Control:
                return control;
            case InstructionClass::Syscall:
                return syscall;
            }
            return basic;
        }

        bool operator==(InstructionCosts const &) const = default;
    };
}
