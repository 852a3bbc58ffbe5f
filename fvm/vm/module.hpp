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
#include <fvm/vm/opcodes.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace fvm::vm
{
    inline constexpr uint32_t PAGE_SIZE = 1u << 16;

    inline constexpr uint8_t MODULE_MAGIC[4] = {'F', 'V', 'M', 'A'};
    inline constexpr uint8_t MODULE_VERSION = 1;

    struct SyscallSignature
    {
        uint16_t id;
        uint8_t num_args;
        uint8_t num_results;
        std::string_view name;
    };

    struct Export
    {
        uint64_t method;
        uint32_t offset;
    };

    /// Compiled actor code: validated instruction stream, linked syscall
    /// signatures and the static gas cost of every basic block. Immutable
    /// after construction and shared between concurrent sandboxes.
    class Module
    {
    public:
        struct Layout
        {
            uint32_t min_pages;
            uint32_t max_pages;
            std::vector<Export> exports;
            byte_string data;
            byte_string code;
        };

        Module(
            Layout layout, std::vector<bool> block_starts,
            std::vector<uint64_t> block_costs,
            ankerl::unordered_dense::map<uint16_t, SyscallSignature> imports,
            InstructionCosts const &costs)
            : layout_{std::move(layout)}
            , block_starts_{std::move(block_starts)}
            , block_costs_{std::move(block_costs)}
            , imports_{std::move(imports)}
            , costs_{costs}
        {
            FVM_ASSERT(block_starts_.size() == layout_.code.size());
            FVM_ASSERT(block_costs_.size() == layout_.code.size());
        }

        Module(Module const &) = delete;
        Module &operator=(Module const &) = delete;

        uint8_t const *code() const noexcept
        {
            return layout_.code.data();
        }

        size_t code_size() const noexcept
        {
            return layout_.code.size();
        }

        bool is_block_start(size_t const pc) const noexcept
        {
            return pc < block_starts_.size() && block_starts_[pc];
        }

        uint64_t block_cost(size_t const pc) const noexcept
        {
            FVM_DEBUG_ASSERT(is_block_start(pc));
            return block_costs_[pc];
        }

        std::optional<uint32_t> entry_point(uint64_t const method) const
        {
            for (auto const &e : layout_.exports) {
                if (e.method == method) {
                    return e.offset;
                }
            }
            return std::nullopt;
        }

        std::span<Export const> exports() const noexcept
        {
            return layout_.exports;
        }

        SyscallSignature const *syscall(uint16_t const id) const
        {
            auto const it = imports_.find(id);
            if (it == imports_.end()) {
                return nullptr;
            }
            return &it->second;
        }

        uint32_t min_pages() const noexcept
        {
            return layout_.min_pages;
        }

        uint32_t max_pages() const noexcept
        {
            return layout_.max_pages;
        }

        byte_string_view data() const noexcept
        {
            return layout_.data;
        }

        InstructionCosts const &costs() const noexcept
        {
            return costs_;
        }

    private:
        Layout layout_;
        std::vector<bool> block_starts_;
        std::vector<uint64_t> block_costs_;
        ankerl::unordered_dense::map<uint16_t, SyscallSignature> imports_;
        InstructionCosts costs_;
    };

    using SharedModule = std::shared_ptr<Module const>;
}
