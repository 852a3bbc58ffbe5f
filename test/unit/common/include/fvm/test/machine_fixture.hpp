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
#include <fvm/execution/executor/executor.hpp>
#include <fvm/execution/machine/machine.hpp>
#include <fvm/execution/machine/machine_config.hpp>
#include <fvm/execution/message.hpp>
#include <fvm/execution/receipt.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/test/config.hpp>
#include <fvm/test/fakes.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>

FVM_TEST_NAMESPACE_BEGIN

/// Little endian, the byte order guest memory stores words in.
inline byte_string le64(uint64_t const value)
{
    byte_string out;
    for (int shift = 0; shift < 64; shift += 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
    return out;
}

/// Builds a genesis state, then a machine on top of it. Actor 100 is a
/// funded account that sends every message.
class MachineTest : public ::testing::Test
{
protected:
    static constexpr ActorID SENDER = 100;
    static constexpr uint64_t GAS_LIMIT = 10'000'000;

    InMemoryBlockstore store;
    FakeExterns externs;
    FakeCryptoOracle oracle;
    StateTree genesis{StateTree::empty(store)};
    bytes32_t genesis_root{};
    std::unique_ptr<Machine> machine;

    void SetUp() override
    {
        add_account(BURNT_FUNDS_ACTOR_ID, 0);
        add_account(REWARD_ACTOR_ID, 0);
        add_account(SENDER, 1'000'000'000'000);
    }

    void add_genesis_actor(ActorID const id, ActorState const &state)
    {
        genesis.set_actor(id, state);
        if (id >= FIRST_NON_SINGLETON_ADDR) {
            genesis.reserve_ids_below(id + 1);
        }
    }

    void add_account(ActorID const id, TokenAmount const &balance)
    {
        add_genesis_actor(id, ActorState{.balance = balance});
    }

    bytes32_t add_actor(
        ActorID const id, byte_string const &code,
        TokenAmount const &balance = 0)
    {
        auto const code_hash = store.put(code);
        add_genesis_actor(
            id, ActorState{.code_hash = code_hash, .balance = balance});
        return code_hash;
    }

    void start(MachineConfig config = {})
    {
        auto const root = genesis.flush();
        ASSERT_TRUE(root.has_value());
        genesis_root = root.value();
        config.state_root = genesis_root;
        auto created = Machine::create(config, store, externs, oracle);
        ASSERT_TRUE(created.has_value());
        machine = std::move(created).value();
    }

    std::optional<ActorState> actor(ActorID const id)
    {
        auto result = machine->state_tree().get_actor(id);
        EXPECT_TRUE(result.has_value());
        return result.has_value() ? result.value() : std::nullopt;
    }

    TokenAmount balance(ActorID const id)
    {
        auto const state = actor(id);
        return state.has_value() ? state->balance : TokenAmount{0};
    }

    TokenAmount total_balance(std::initializer_list<ActorID> const ids)
    {
        TokenAmount total{0};
        for (auto const id : ids) {
            total += balance(id);
        }
        return total;
    }

    /// A message from SENDER with the current sequence and no gas price.
    Message message(
        ActorID const to, MethodNum const method,
        TokenAmount const &value = 0, byte_string params = {})
    {
        auto const sender = actor(SENDER);
        return Message{
            .from = SENDER,
            .to = to,
            .method = method,
            .params = std::move(params),
            .value = value,
            .gas_limit = GAS_LIMIT,
            .sequence = sender.has_value() ? sender->sequence : 0};
    }

    ApplyRet apply(Message const &msg)
    {
        auto result = machine->new_executor().apply(msg);
        EXPECT_TRUE(result.has_value());
        if (!result.has_value()) {
            return {};
        }
        return std::move(result).value();
    }
};

FVM_TEST_NAMESPACE_END
