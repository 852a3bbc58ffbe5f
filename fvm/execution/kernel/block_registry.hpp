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
#include <fvm/core/config.hpp>
#include <fvm/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

FVM_NAMESPACE_BEGIN

using BlockHandle = uint64_t;

// 0 is never a valid handle and stands for "no block"
inline constexpr BlockHandle NO_BLOCK = 0;

/// Blocks opened or created by one frame, addressed by handle.
class BlockRegistry
{
    std::vector<byte_string> blocks_;

public:
    static constexpr size_t MAX_BLOCKS = 1024;

    /// `ErrorNumber::LimitExceeded` once MAX_BLOCKS are held.
    Result<BlockHandle> put(byte_string);

    /// `ErrorNumber::InvalidHandle` for unknown handles.
    Result<byte_string const *> get(BlockHandle) const;

    size_t size() const noexcept
    {
        return blocks_.size();
    }
};

FVM_NAMESPACE_END
