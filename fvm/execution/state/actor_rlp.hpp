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
#include <fvm/core/result.hpp>
#include <fvm/core/rlp/config.hpp>
#include <fvm/execution/state/actor_state.hpp>

FVM_RLP_NAMESPACE_BEGIN

byte_string encode_actor_state(ActorState const &);

Result<ActorState> decode_actor_state(byte_string_view &);

FVM_RLP_NAMESPACE_END
