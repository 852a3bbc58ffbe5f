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

#include <fvm/core/config.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/types.hpp>

FVM_ANONYMOUS_NAMESPACE_BEGIN

constexpr PriceList V1_PRICES{
    .instructions =
        {.basic = 1,
         .memory = 2,
         .control = 2,
         .syscall = 0},
    .syscall = 14,
    .memory_page = 100,
    .chain_message = {.flat = 100, .per_byte = 2},
    .block_open = {.flat = 60, .per_byte = 1},
    .block_read = {.flat = 10, .per_byte = 1},
    .block_create = {.flat = 20, .per_byte = 1},
    .block_link = {.flat = 200, .per_byte = 3},
    .set_root = 50,
    .create_actor = 500,
    .actor_lookup = 20,
    .send_base = 100,
    .send_transfer_funds = 50,
    .self_destruct = 200,
    .hash = {.flat = 30, .per_byte = 1},
    .verify = {{{.flat = 1000, .per_byte = 2}, {.flat = 5000, .per_byte = 4}}},
    .randomness = {.flat = 50, .per_byte = 1},
    .emit_event = {.flat = 100, .per_byte = 2},
};

// storage writes and memory growth repriced
constexpr PriceList V2_PRICES{
    .instructions =
        {.basic = 1,
         .memory = 3,
         .control = 3,
         .syscall = 0},
    .syscall = 14,
    .memory_page = 200,
    .chain_message = {.flat = 120, .per_byte = 2},
    .block_open = {.flat = 60, .per_byte = 1},
    .block_read = {.flat = 10, .per_byte = 1},
    .block_create = {.flat = 30, .per_byte = 2},
    .block_link = {.flat = 300, .per_byte = 5},
    .set_root = 80,
    .create_actor = 650,
    .actor_lookup = 20,
    .send_base = 120,
    .send_transfer_funds = 50,
    .self_destruct = 200,
    .hash = {.flat = 30, .per_byte = 1},
    .verify = {{{.flat = 1000, .per_byte = 2}, {.flat = 5000, .per_byte = 4}}},
    .randomness = {.flat = 50, .per_byte = 1},
    .emit_event = {.flat = 120, .per_byte = 3},
};

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

PriceList const *price_list_by_version(NetworkVersion const version)
{
    switch (version) {
    case NetworkVersion::V1:
        return &V1_PRICES;
    case NetworkVersion::V2:
        return &V2_PRICES;
    }
    return nullptr;
}

FVM_NAMESPACE_END
