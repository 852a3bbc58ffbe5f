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
#include <fvm/vm/module.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace fvm::vm
{
    /// Zero initialised linear memory of whole pages, never larger than
    /// `max_pages`.
    class Memory
    {
        std::vector<uint8_t> bytes_;
        uint32_t max_pages_;

    public:
        Memory(uint32_t initial_pages, uint32_t max_pages);

        Memory(Memory const &) = delete;
        Memory &operator=(Memory const &) = delete;

        uint32_t pages() const noexcept
        {
            return static_cast<uint32_t>(bytes_.size() / PAGE_SIZE);
        }

        uint32_t max_pages() const noexcept
        {
            return max_pages_;
        }

        size_t size() const noexcept
        {
            return bytes_.size();
        }

        bool in_bounds(uint64_t const offset, uint64_t const len) const noexcept
        {
            return offset <= bytes_.size() && len <= bytes_.size() - offset;
        }

        /// Returns false, leaving memory untouched, if the result would
        /// exceed the bound.
        bool grow(uint32_t delta_pages);

        std::span<uint8_t> span(uint64_t offset, uint64_t len);

        std::span<uint8_t const> span(uint64_t offset, uint64_t len) const;

        byte_string_view view(uint64_t offset, uint64_t len) const;
    };
}
