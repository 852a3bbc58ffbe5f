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
#include <fvm/core/result.hpp>
#include <fvm/execution/types.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

/// Chain data the engine does not own.
class Externs
{
public:
    virtual ~Externs() = default;

    /// Ticket randomness seed of `round`.
    virtual Result<bytes32_t> get_chain_randomness(ChainEpoch round) = 0;

    /// Beacon randomness seed of `round`.
    virtual Result<bytes32_t> get_beacon_randomness(ChainEpoch round) = 0;
};

/// Signature and proof checking, and hash functions the engine does not
/// implement itself. Must be deterministic. An `ErrorNumber` error is
/// reported to the calling actor; any other error is fatal to the message.
class CryptoOracle
{
public:
    virtual ~CryptoOracle() = default;

    virtual Result<bool> verify(uint64_t kind, byte_string_view input) = 0;

    virtual Result<bytes32_t> hash(uint64_t kind, byte_string_view input) = 0;
};

FVM_NAMESPACE_END
