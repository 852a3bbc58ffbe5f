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
#include <fvm/core/bytes.hpp>
#include <fvm/core/keccak.hpp>
#include <fvm/core/rlp/config.hpp>
#include <fvm/core/rlp/encode.hpp>
#include <fvm/execution/event.hpp>
#include <fvm/execution/rlp/event_rlp.hpp>

#include <span>
#include <vector>

FVM_RLP_NAMESPACE_BEGIN

byte_string encode_event(ActorEvent const &event)
{
    return encode_list(
        encode_unsigned(event.emitter), encode_string(event.data));
}

byte_string encode_events(std::span<ActorEvent const> const events)
{
    std::vector<byte_string> items;
    items.reserve(events.size());
    for (auto const &event : events) {
        items.emplace_back(encode_event(event));
    }
    return encode_list(items);
}

FVM_RLP_NAMESPACE_END

FVM_NAMESPACE_BEGIN

bytes32_t events_root(std::span<ActorEvent const> const events)
{
    return to_bytes(keccak256(rlp::encode_events(events)));
}

FVM_NAMESPACE_END
