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
#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace fvm::vm
{
    Memory::Memory(uint32_t const initial_pages, uint32_t const max_pages)
        : bytes_(static_cast<size_t>(initial_pages) * PAGE_SIZE, 0)
        , max_pages_{max_pages}
    {
        FVM_ASSERT(initial_pages <= max_pages);
    }

    bool Memory::grow(uint32_t const delta_pages)
    {
        uint64_t const new_pages = uint64_t{pages()} + delta_pages;
        if (new_pages > max_pages_) {
            return false;
        }
        bytes_.resize(static_cast<size_t>(new_pages) * PAGE_SIZE, 0);
        return true;
    }

    std::span<uint8_t> Memory::span(uint64_t const offset, uint64_t const len)
    {
        FVM_ASSERT(in_bounds(offset, len));
        return {bytes_.data() + offset, static_cast<size_t>(len)};
    }

    std::span<uint8_t const>
    Memory::span(uint64_t const offset, uint64_t const len) const
    {
        FVM_ASSERT(in_bounds(offset, len));
        return {bytes_.data() + offset, static_cast<size_t>(len)};
    }

    byte_string_view
    Memory::view(uint64_t const offset, uint64_t const len) const
    {
        auto const s = span(offset, len);
        return {s.data(), s.size()};
    }
}
