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

#include <fvm/core/bytes.hpp>
#include <fvm/core/config.hpp>
#include <fvm/execution/engine_config.hpp>
#include <fvm/execution/types.hpp>

#include <cstdint>
#include <optional>

FVM_NAMESPACE_BEGIN

struct MachineConfig
{
    NetworkVersion network_version{NetworkVersion::V2};
    ChainEpoch epoch{0};
    TokenAmount base_fee{100};
    uint64_t chain_id{314};
    // nullopt starts from an empty tree
    std::optional<bytes32_t> state_root{};
    uint64_t block_gas_limit{10'000'000'000};
    // replaces the network version's limits
    std::optional<EngineConfig> engine{};
};

FVM_NAMESPACE_END
