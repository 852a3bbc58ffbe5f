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
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/kernel/block_registry.hpp>

#include <utility>

FVM_NAMESPACE_BEGIN

Result<BlockHandle> BlockRegistry::put(byte_string block)
{
    if (FVM_UNLIKELY(blocks_.size() >= MAX_BLOCKS)) {
        return ErrorNumber::LimitExceeded;
    }
    blocks_.push_back(std::move(block));
    return static_cast<BlockHandle>(blocks_.size());
}

Result<byte_string const *> BlockRegistry::get(BlockHandle const handle) const
{
    if (FVM_UNLIKELY(handle == NO_BLOCK || handle > blocks_.size())) {
        return ErrorNumber::InvalidHandle;
    }
    return &blocks_[handle - 1];
}

FVM_NAMESPACE_END
