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
#include <fvm/execution/event.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/types.hpp>

#include <cstdint>
#include <vector>

FVM_NAMESPACE_BEGIN

struct Receipt
{
    ExitCode exit_code{ExitCode::OK};
    byte_string return_data{};
    uint64_t gas_used{0};
    bytes32_t events_root{};

    friend bool operator==(Receipt const &, Receipt const &) = default;
};

/// Result of applying one message: the receipt plus where every unit of
/// the sender's gas deposit went.
struct ApplyRet
{
    Receipt receipt{};
    // charged to the block producer, outside of the message's gas
    TokenAmount penalty{0};
    TokenAmount miner_tip{0};
    TokenAmount base_fee_burn{0};
    TokenAmount over_estimation_burn{0};
    TokenAmount refund{0};
    uint64_t gas_refund{0};
    uint64_t gas_burned{0};
    std::vector<ActorEvent> events{};
};

FVM_NAMESPACE_END
