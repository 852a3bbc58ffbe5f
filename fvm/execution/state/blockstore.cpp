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
#include <fvm/core/bytes.hpp>
#include <fvm/core/keccak.hpp>
#include <fvm/execution/state/blockstore.hpp>

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>

FVM_NAMESPACE_BEGIN

std::optional<byte_string>
InMemoryBlockstore::get(bytes32_t const &hash) const
{
    std::shared_lock const lock{mutex_};
    auto const it = blocks_.find(hash);
    if (it == blocks_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bytes32_t InMemoryBlockstore::put(byte_string_view const block)
{
    bytes32_t const hash = to_bytes(keccak256(block));
    std::unique_lock const lock{mutex_};
    blocks_.try_emplace(hash, block);
    return hash;
}

size_t InMemoryBlockstore::size() const
{
    std::shared_lock const lock{mutex_};
    return blocks_.size();
}

FVM_NAMESPACE_END
