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

#include <fvm/core/config.hpp>
#include <fvm/core/int.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

using ActorID = uint64_t;
using MethodNum = uint64_t;
using TokenAmount = uint256_t;
using ChainEpoch = int64_t;

inline constexpr ActorID SYSTEM_ACTOR_ID = 0;
inline constexpr ActorID REWARD_ACTOR_ID = 2;
inline constexpr ActorID BURNT_FUNDS_ACTOR_ID = 99;

// first id handed out by actor creation in a fresh tree
inline constexpr ActorID FIRST_NON_SINGLETON_ADDR = 100;

inline constexpr MethodNum METHOD_SEND = 0;

enum class NetworkVersion : uint32_t
{
    V1 = 1,
    V2 = 2,
};

FVM_NAMESPACE_END
