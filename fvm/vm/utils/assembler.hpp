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

#include <fvm/core/assert.h>
#include <fvm/core/byte_string.hpp>
#include <fvm/core/unaligned.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fvm::vm::utils
{
    /// Builds module containers from readable instruction sequences. Labels
    /// may be referenced before they are defined.
    class Assembler
    {
    public:
        Assembler &memory(uint16_t const min_pages, uint16_t const max_pages)
        {
            min_pages_ = min_pages;
            max_pages_ = max_pages;
            return *this;
        }

        Assembler &data(byte_string d)
        {
            data_ = std::move(d);
            return *this;
        }

        Assembler &
        export_method(uint64_t const method, std::string const &label)
        {
            exports_.emplace_back(method, label);
            return *this;
        }

        Assembler &label(std::string const &name)
        {
            FVM_ASSERT(!labels_.contains(name));
            labels_.emplace(name, static_cast<uint32_t>(code_.size()));
            return *this;
        }

        Assembler &ins(OpCode const op)
        {
            FVM_ASSERT(opcode_table[op].immediate_size == 0);
            code_.push_back(op);
            return *this;
        }

        /// Emits any byte, valid or not.
        Assembler &raw(uint8_t const byte)
        {
            code_.push_back(byte);
            return *this;
        }

        Assembler &push(uint64_t const imm)
        {
            if (imm <= UINT8_MAX) {
                code_.push_back(PUSH1);
                code_.push_back(static_cast<uint8_t>(imm));
            }
            else if (imm <= UINT32_MAX) {
                code_.push_back(PUSH4);
                append(static_cast<uint32_t>(imm));
            }
            else {
                code_.push_back(PUSH8);
                append(imm);
            }
            return *this;
        }

        Assembler &dup(uint8_t const n)
        {
            code_.push_back(DUP);
            code_.push_back(n);
            return *this;
        }

        Assembler &swap(uint8_t const n)
        {
            code_.push_back(SWAP);
            code_.push_back(n);
            return *this;
        }

        Assembler &jump(std::string const &target)
        {
            return branch(JUMP, target);
        }

        Assembler &jumpi(std::string const &target)
        {
            return branch(JUMPI, target);
        }

        /// Jump to a raw offset, bypassing label resolution.
        Assembler &jump_to(uint32_t const offset)
        {
            code_.push_back(JUMP);
            append(offset);
            return *this;
        }

        Assembler &syscall(uint16_t const id)
        {
            code_.push_back(SYSCALL);
            append(id);
            return *this;
        }

        /// RETURN of `len` bytes at `offset`.
        Assembler &ret(uint64_t const offset, uint64_t const len)
        {
            return push(offset).push(len).ins(RETURN);
        }

        Assembler &abort(uint64_t const code)
        {
            return push(code).ins(ABORT);
        }

        byte_string build() const
        {
            byte_string code = code_;
            for (auto const &[pos, name] : fixups_) {
                unaligned_store(&code[pos], resolve(name));
            }

            byte_string out;
            out.append(MODULE_MAGIC, sizeof(MODULE_MAGIC));
            out.push_back(MODULE_VERSION);
            append_to(out, min_pages_);
            append_to(out, max_pages_);
            append_to(out, static_cast<uint16_t>(exports_.size()));
            for (auto const &[method, name] : exports_) {
                append_to(out, method);
                append_to(out, resolve(name));
            }
            append_to(out, static_cast<uint32_t>(data_.size()));
            out += data_;
            append_to(out, static_cast<uint32_t>(code.size()));
            out += code;
            return out;
        }

    private:
        uint16_t min_pages_{1};
        uint16_t max_pages_{1};
        byte_string data_;
        byte_string code_;
        std::vector<std::pair<uint64_t, std::string>> exports_;
        std::map<std::string, uint32_t> labels_;
        std::vector<std::pair<size_t, std::string>> fixups_;

        template <typename T>
        static void append_to(byte_string &out, T const value)
        {
            uint8_t buf[sizeof(T)];
            unaligned_store(buf, value);
            out.append(buf, sizeof(T));
        }

        template <typename T>
        void append(T const value)
        {
            append_to(code_, value);
        }

        Assembler &branch(OpCode const op, std::string const &target)
        {
            code_.push_back(op);
            fixups_.emplace_back(code_.size(), target);
            append(uint32_t{0});
            return *this;
        }

        uint32_t resolve(std::string const &name) const
        {
            auto const it = labels_.find(name);
            FVM_ASSERT(it != labels_.end(), "undefined label");
            return it->second;
        }
    };
}
