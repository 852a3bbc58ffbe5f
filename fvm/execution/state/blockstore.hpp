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
#include <fvm/core/bytes.hpp>
#include <fvm/core/config.hpp>

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <optional>
#include <shared_mutex>

FVM_NAMESPACE_BEGIN

/// Content addressed store: blocks are keyed by the keccak256 of their
/// bytes.
class Blockstore
{
public:
    virtual ~Blockstore() = default;

    virtual std::optional<byte_string> get(bytes32_t const &) const = 0;

    virtual bytes32_t put(byte_string_view) = 0;
};

/// Thread safe for concurrent readers and writers.
class InMemoryBlockstore final : public Blockstore
{
    mutable std::shared_mutex mutex_;
    ankerl::unordered_dense::segmented_map<bytes32_t, byte_string> blocks_;

public:
    std::optional<byte_string> get(bytes32_t const &) const override;

    bytes32_t put(byte_string_view) override;

    size_t size() const;
};

FVM_NAMESPACE_END
