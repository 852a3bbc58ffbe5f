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
#include <fvm/execution/types.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

struct ActorState
{
    bytes32_t code_hash{NULL_HASH};
    bytes32_t state_root{NULL_HASH};
    uint64_t sequence{0};
    TokenAmount balance{0};

    bool has_code() const noexcept
    {
        return code_hash != NULL_HASH;
    }

    friend bool operator==(ActorState const &, ActorState const &) = default;
};

FVM_NAMESPACE_END
