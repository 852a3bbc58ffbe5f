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
#include <fvm/execution/message.hpp>
#include <fvm/execution/rlp/message_rlp.hpp>
#include <fvm/execution/types.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>

FVM_RLP_NAMESPACE_BEGIN

byte_string encode_message(Message const &msg)
{
    return encode_list(
        encode_unsigned(msg.sequence),
        encode_unsigned(msg.from),
        encode_unsigned(msg.to),
        encode_unsigned(msg.method),
        encode_string(msg.params),
        encode_unsigned(msg.value),
        encode_unsigned(msg.gas_limit),
        encode_unsigned(msg.gas_fee_cap),
        encode_unsigned(msg.gas_premium));
}

Result<Message> decode_message(byte_string_view &enc)
{
    Message msg;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(msg.sequence, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(msg.from, decode_unsigned<ActorID>(payload));
    BOOST_OUTCOME_TRY(msg.to, decode_unsigned<ActorID>(payload));
    BOOST_OUTCOME_TRY(msg.method, decode_unsigned<MethodNum>(payload));
    BOOST_OUTCOME_TRY(auto const params, decode_string(payload));
    msg.params = byte_string{params};
    BOOST_OUTCOME_TRY(msg.value, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(msg.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(msg.gas_fee_cap, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(msg.gas_premium, decode_unsigned<uint256_t>(payload));
    if (FVM_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }
    return msg;
}

FVM_RLP_NAMESPACE_END
