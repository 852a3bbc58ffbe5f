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
#include <fvm/execution/genesis.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace fvm;

TEST(Genesis, load_allocations)
{
    InMemoryBlockstore store;
    auto const root = load_genesis_state(
        R"({
            "99": {"balance": "0"},
            "100": {"balance": "1000000000000000000000", "sequence": 3},
            "1000": {"balance": "0x10", "code": "0x0102ff"}
        })",
        store);
    ASSERT_FALSE(root.has_error());

    auto loaded = StateTree::load(store, root.value());
    ASSERT_FALSE(loaded.has_error());
    auto &state = loaded.value();

    auto const burnt = state.get_actor(99).value();
    ASSERT_TRUE(burnt.has_value());
    EXPECT_EQ(burnt->balance, 0);
    EXPECT_FALSE(burnt->has_code());

    auto const account = state.get_actor(100).value();
    ASSERT_TRUE(account.has_value());
    EXPECT_EQ(
        account->balance, intx::from_string<uint256_t>("1000000000000000000000"));
    EXPECT_EQ(account->sequence, 3);

    byte_string const code{0x01, 0x02, 0xff};
    auto const actor = state.get_actor(1000).value();
    ASSERT_TRUE(actor.has_value());
    EXPECT_EQ(actor->balance, 16);
    EXPECT_EQ(actor->code_hash, to_bytes(keccak256(code)));
    EXPECT_EQ(store.get(actor->code_hash), code);

    EXPECT_EQ(state.get_actor(101).value(), std::nullopt);
    EXPECT_EQ(state.next_actor_id(), 1001);
}

TEST(Genesis, same_document_same_root)
{
    InMemoryBlockstore store;
    auto const a = load_genesis_state(
        R"({"100": {"balance": "5"}, "200": {"balance": "6"}})", store);
    auto const b = load_genesis_state(
        R"({"200": {"balance": "6"}, "100": {"balance": "5"}})", store);
    ASSERT_FALSE(a.has_error());
    ASSERT_FALSE(b.has_error());
    EXPECT_EQ(a.value(), b.value());

    auto const empty = load_genesis_state("{}", store);
    ASSERT_FALSE(empty.has_error());
    EXPECT_NE(empty.value(), a.value());
}

TEST(Genesis, invalid_documents)
{
    InMemoryBlockstore store;
    auto const error = [&](char const *const document) {
        return load_genesis_state(document, store).error();
    };

    EXPECT_EQ(error("not json"), GenesisError::InvalidDocument);
    EXPECT_EQ(error("[1, 2]"), GenesisError::InvalidDocument);
    EXPECT_EQ(error(R"({"100": 5})"), GenesisError::InvalidDocument);
    EXPECT_EQ(error(R"({"abc": {}})"), GenesisError::InvalidActorId);
    EXPECT_EQ(error(R"({"-1": {}})"), GenesisError::InvalidActorId);
    EXPECT_EQ(
        error(R"({"100": {"balance": 5}})"), GenesisError::InvalidBalance);
    EXPECT_EQ(
        error(R"({"100": {"balance": "12ab"}})"),
        GenesisError::InvalidBalance);
    EXPECT_EQ(
        error(R"({"100": {"sequence": -1}})"), GenesisError::InvalidSequence);
    EXPECT_EQ(error(R"({"100": {"code": "0x"}})"), GenesisError::InvalidCode);
    EXPECT_EQ(error(R"({"100": {"code": "zz"}})"), GenesisError::InvalidCode);
}
