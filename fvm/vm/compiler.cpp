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

#include <fvm/core/assert.h>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/core/unaligned.hpp>
#include <fvm/vm/compile_error.hpp>
#include <fvm/vm/compiler.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>

#include <ankerl/unordered_dense.h>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace fvm::vm
{
    namespace
    {
        class Reader
        {
            byte_string_view in_;

        public:
            explicit Reader(byte_string_view const in)
                : in_{in}
            {
            }

            bool empty() const noexcept
            {
                return in_.empty();
            }

            template <typename T>
            Result<T> read()
            {
                if (FVM_UNLIKELY(in_.size() < sizeof(T))) {
                    return CompileError::Truncated;
                }
                T const value = unaligned_load<T>(in_.data());
                in_.remove_prefix(sizeof(T));
                return value;
            }

            Result<byte_string_view> read_bytes(size_t const n)
            {
                if (FVM_UNLIKELY(in_.size() < n)) {
                    return CompileError::Truncated;
                }
                auto const bytes = in_.substr(0, n);
                in_.remove_prefix(n);
                return bytes;
            }
        };

        Result<Module::Layout>
        decode(byte_string_view const input, CompileOptions const &options)
        {
            Reader r{input};

            BOOST_OUTCOME_TRY(auto const magic, r.read_bytes(4));
            if (!std::equal(magic.begin(), magic.end(), MODULE_MAGIC)) {
                return CompileError::BadMagic;
            }
            BOOST_OUTCOME_TRY(auto const version, r.read<uint8_t>());
            if (version != MODULE_VERSION) {
                return CompileError::UnsupportedVersion;
            }

            Module::Layout layout;
            BOOST_OUTCOME_TRY(layout.min_pages, r.read<uint16_t>());
            BOOST_OUTCOME_TRY(layout.max_pages, r.read<uint16_t>());
            if (layout.min_pages > layout.max_pages ||
                layout.max_pages > options.max_memory_pages) {
                return CompileError::MemoryLimitExceeded;
            }

            BOOST_OUTCOME_TRY(auto const export_count, r.read<uint16_t>());
            layout.exports.reserve(export_count);
            for (uint16_t i = 0; i < export_count; ++i) {
                BOOST_OUTCOME_TRY(auto const method, r.read<uint64_t>());
                BOOST_OUTCOME_TRY(auto const offset, r.read<uint32_t>());
                layout.exports.push_back({.method = method, .offset = offset});
            }

            BOOST_OUTCOME_TRY(auto const data_size, r.read<uint32_t>());
            if (static_cast<uint64_t>(data_size) >
                static_cast<uint64_t>(layout.min_pages) * PAGE_SIZE) {
                return CompileError::DataSegmentTooLarge;
            }
            BOOST_OUTCOME_TRY(auto const data, r.read_bytes(data_size));
            layout.data = byte_string{data};

            BOOST_OUTCOME_TRY(auto const code_size, r.read<uint32_t>());
            if (code_size > options.max_code_size) {
                return CompileError::CodeTooLarge;
            }
            BOOST_OUTCOME_TRY(auto const code, r.read_bytes(code_size));
            layout.code = byte_string{code};

            if (!r.empty()) {
                return CompileError::TrailingBytes;
            }
            return layout;
        }

        SyscallSignature const *find_syscall(
            std::span<SyscallSignature const> const syscalls,
            uint16_t const id)
        {
            auto const it = std::find_if(
                syscalls.begin(), syscalls.end(), [id](auto const &s) {
                    return s.id == id;
                });
            return it == syscalls.end() ? nullptr : &*it;
        }
    }

    Result<SharedModule>
    compile(byte_string_view const input, CompileOptions const &options)
    {
        BOOST_OUTCOME_TRY(auto layout, decode(input, options));

        byte_string_view const code = layout.code;
        size_t const size = code.size();

        std::vector<bool> instruction_starts(size, false);
        std::vector<bool> block_starts(size, false);
        std::vector<uint64_t> block_costs(size, 0);
        std::vector<uint32_t> jump_targets;
        ankerl::unordered_dense::map<uint16_t, SyscallSignature> imports;

        // decode the instruction stream and link syscalls
        for (size_t pc = 0; pc < size;) {
            uint8_t const op = code[pc];
            auto const &info = opcode_table[op];
            if (FVM_UNLIKELY(is_float_opcode(op))) {
                return CompileError::NondeterministicInstruction;
            }
            if (FVM_UNLIKELY(is_unknown_opcode_info(info))) {
                return CompileError::IllegalInstruction;
            }
            if (FVM_UNLIKELY(pc + 1 + info.immediate_size > size)) {
                return CompileError::TruncatedImmediate;
            }
            instruction_starts[pc] = true;

            if (op == JUMP || op == JUMPI) {
                jump_targets.push_back(
                    unaligned_load<uint32_t>(code.data() + pc + 1));
            }
            else if (op == SYSCALL) {
                auto const id = unaligned_load<uint16_t>(code.data() + pc + 1);
                auto const *const sig = find_syscall(options.syscalls, id);
                if (FVM_UNLIKELY(sig == nullptr)) {
                    return CompileError::UnknownSyscall;
                }
                imports.try_emplace(id, *sig);
            }

            size_t const next = pc + 1 + info.immediate_size;
            if (info.terminator && next < size) {
                block_starts[next] = true;
            }
            pc = next;
        }

        for (auto const target : jump_targets) {
            if (FVM_UNLIKELY(target >= size || !instruction_starts[target])) {
                return CompileError::InvalidJumpTarget;
            }
            block_starts[target] = true;
        }

        for (size_t i = 0; i < layout.exports.size(); ++i) {
            auto const &e = layout.exports[i];
            if (FVM_UNLIKELY(
                    e.offset >= size || !instruction_starts[e.offset])) {
                return CompileError::InvalidExport;
            }
            for (size_t j = 0; j < i; ++j) {
                if (FVM_UNLIKELY(layout.exports[j].method == e.method)) {
                    return CompileError::InvalidExport;
                }
            }
            block_starts[e.offset] = true;
        }

        if (size > 0) {
            block_starts[0] = true;
        }

        // static gas per basic block, charged on entry
        size_t leader = 0;
        for (size_t pc = 0; pc < size;) {
            if (block_starts[pc]) {
                leader = pc;
            }
            auto const &info = opcode_table[code[pc]];
            block_costs[leader] += options.costs.of(info.cls);
            pc += 1 + info.immediate_size;
        }

        return std::make_shared<Module const>(
            std::move(layout),
            std::move(block_starts),
            std::move(block_costs),
            std::move(imports),
            options.costs);
    }
}
