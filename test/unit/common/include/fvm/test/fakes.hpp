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
#include <fvm/core/keccak.hpp>
#include <fvm/core/result.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/externs.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/test/config.hpp>

#include <bit>
#include <cstdint>

FVM_TEST_NAMESPACE_BEGIN

/// Seeds are a pure function of the round.
class FakeExterns final : public Externs
{
    static bytes32_t seed(uint8_t const domain, ChainEpoch const round)
    {
        byte_string input{domain};
        auto const r = std::bit_cast<uint64_t>(round);
        for (int shift = 0; shift < 64; shift += 8) {
            input.push_back(static_cast<uint8_t>(r >> shift));
        }
        return to_bytes(keccak256(input));
    }

public:
    Result<bytes32_t> get_chain_randomness(ChainEpoch const round) override
    {
        return seed(1, round);
    }

    Result<bytes32_t> get_beacon_randomness(ChainEpoch const round) override
    {
        return seed(2, round);
    }
};

/// Accepts inputs starting with 0x01. Hash kind 2 is keccak256 of the input
/// twice. `fail` makes every call report an unavailable oracle.
class FakeCryptoOracle final : public CryptoOracle
{
public:
    static constexpr uint64_t DOUBLE_KECCAK = 2;

    bool fail{false};

    Result<bool> verify(uint64_t, byte_string_view const input) override
    {
        if (fail) {
            return ExecutionError::OracleFailure;
        }
        return !input.empty() && input[0] == 0x01;
    }

    Result<bytes32_t>
    hash(uint64_t const kind, byte_string_view const input) override
    {
        if (fail) {
            return ExecutionError::OracleFailure;
        }
        if (kind != DOUBLE_KECCAK) {
            return ErrorNumber::IllegalArgument;
        }
        auto const once = keccak256(input);
        return to_bytes(keccak256({once.bytes, sizeof(once.bytes)}));
    }
};

FVM_TEST_NAMESPACE_END
