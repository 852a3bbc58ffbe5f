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
#include <fvm/core/rlp/config.hpp>
#include <fvm/core/rlp/decode.hpp>
#include <fvm/core/rlp/decode_error.hpp>
#include <fvm/core/rlp/encode.hpp>
#include <fvm/execution/state/actor_rlp.hpp>
#include <fvm/execution/state/actor_state.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

FVM_RLP_NAMESPACE_BEGIN

byte_string encode_actor_state(ActorState const &actor)
{
    return encode_list(
        encode_bytes32(actor.code_hash),
        encode_bytes32(actor.state_root),
        encode_unsigned(actor.sequence),
        encode_unsigned(actor.balance));
}

Result<ActorState> decode_actor_state(byte_string_view &enc)
{
    ActorState actor;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(actor.code_hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(actor.state_root, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(actor.sequence, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(actor.balance, decode_unsigned<uint256_t>(payload));
    if (FVM_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return actor;
}

FVM_RLP_NAMESPACE_END
