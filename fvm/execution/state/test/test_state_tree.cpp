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
#include <fvm/core/rlp/decode_error.hpp>
#include <fvm/core/rlp/encode.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/event.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace fvm;

namespace
{
    ActorState account(uint64_t const balance)
    {
        return ActorState{.balance = balance};
    }
}

TEST(StateTree, empty)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    EXPECT_EQ(tree.version(), 0);
    EXPECT_EQ(tree.next_actor_id(), FIRST_NON_SINGLETON_ADDR);
    EXPECT_EQ(tree.get_actor(100).value(), std::nullopt);
    EXPECT_EQ(store.size(), 0);

    // flushing an untouched tree stores the same root it started with
    auto const root = tree.root();
    EXPECT_EQ(tree.flush().value(), root);
    EXPECT_TRUE(store.get(root).has_value());
}

TEST(StateTree, flush_and_load)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    tree.set_actor(100, account(5));
    tree.set_actor(101, account(6));
    EXPECT_EQ(tree.register_new_id(), 100);
    auto const root = tree.flush();
    ASSERT_FALSE(root.has_error());

    auto loaded = StateTree::load(store, root.value());
    ASSERT_FALSE(loaded.has_error());
    auto &reloaded = loaded.value();
    EXPECT_EQ(reloaded.root(), root.value());
    EXPECT_EQ(reloaded.get_actor(100).value(), account(5));
    EXPECT_EQ(reloaded.get_actor(101).value(), account(6));
    EXPECT_EQ(reloaded.get_actor(102).value(), std::nullopt);
    EXPECT_EQ(reloaded.next_actor_id(), 101);
}

TEST(StateTree, root_is_a_function_of_contents)
{
    InMemoryBlockstore store;
    auto a = StateTree::empty(store);
    a.set_actor(100, account(1));
    a.set_actor(200, account(2));

    auto b = StateTree::empty(store);
    b.set_actor(200, account(2));
    b.set_actor(100, account(7));
    b.set_actor(100, account(1));

    EXPECT_EQ(a.flush().value(), b.flush().value());

    b.set_actor(100, account(2));
    EXPECT_NE(a.root(), b.flush().value());
}

TEST(StateTree, load_missing_root)
{
    InMemoryBlockstore store;
    using namespace evmc::literals;
    auto const result = StateTree::load(
        store,
        0x1111111111111111111111111111111111111111111111111111111111111111_bytes32);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), ExecutionError::MissingBlock);
}

TEST(StateTree, load_corrupt_index)
{
    InMemoryBlockstore store;

    auto const not_a_list = store.put(rlp::encode_unsigned(5u));
    EXPECT_EQ(
        StateTree::load(store, not_a_list).error(),
        rlp::DecodeError::TypeUnexpected);

    auto const entry = [](uint64_t const id) {
        return rlp::encode_list(
            rlp::encode_unsigned(id), rlp::encode_bytes32(NULL_HASH));
    };
    auto const descending = store.put(rlp::encode_list(
        rlp::encode_unsigned(200u), rlp::encode_list(entry(101), entry(100))));
    EXPECT_EQ(
        StateTree::load(store, descending).error(),
        ExecutionError::CorruptState);
}

TEST(StateTree, missing_actor_block)
{
    InMemoryBlockstore store;
    using namespace evmc::literals;
    auto const dangling = store.put(rlp::encode_list(
        rlp::encode_unsigned(200u),
        rlp::encode_list(rlp::encode_list(
            rlp::encode_unsigned(100u),
            rlp::encode_bytes32(
                0x2222222222222222222222222222222222222222222222222222222222222222_bytes32)))));
    auto tree = StateTree::load(store, dangling);
    ASSERT_FALSE(tree.has_error());
    EXPECT_EQ(
        tree.value().get_actor(100).error(), ExecutionError::MissingBlock);
}

TEST(StateTree, nested_checkpoints)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    tree.set_actor(100, account(10));
    auto const root = tree.flush().value();

    tree.push();
    tree.set_actor(100, account(20));
    tree.push();
    tree.set_actor(100, account(30));
    tree.set_actor(101, account(1));
    EXPECT_EQ(tree.get_actor(100).value(), account(30));

    tree.pop_reject();
    EXPECT_EQ(tree.get_actor(100).value(), account(20));
    EXPECT_EQ(tree.get_actor(101).value(), std::nullopt);

    tree.pop_reject();
    EXPECT_EQ(tree.get_actor(100).value(), account(10));
    EXPECT_EQ(tree.version(), 0);
    EXPECT_EQ(tree.flush().value(), root);
}

TEST(StateTree, accept_then_reject_outer)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    auto const root = tree.flush().value();

    tree.push();
    tree.push();
    tree.set_actor(100, account(1));
    EXPECT_EQ(tree.register_new_id(), 100);
    tree.pop_accept();
    EXPECT_EQ(tree.get_actor(100).value(), account(1));
    EXPECT_EQ(tree.next_actor_id(), 101);

    tree.pop_reject();
    EXPECT_EQ(tree.get_actor(100).value(), std::nullopt);
    EXPECT_EQ(tree.next_actor_id(), 100);
    EXPECT_EQ(tree.flush().value(), root);
}

TEST(StateTree, delete_actor)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    tree.set_actor(100, account(1));
    auto const with_actor = tree.flush().value();

    tree.push();
    tree.delete_actor(100);
    EXPECT_EQ(tree.get_actor(100).value(), std::nullopt);
    tree.pop_accept();
    auto const without_actor = tree.flush().value();
    EXPECT_NE(with_actor, without_actor);

    auto reloaded = StateTree::load(store, without_actor);
    ASSERT_FALSE(reloaded.has_error());
    EXPECT_EQ(reloaded.value().get_actor(100).value(), std::nullopt);
}

TEST(StateTree, create_actor)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    EXPECT_EQ(
        tree.create_actor(100, account(0)).error(),
        ErrorNumber::IllegalArgument);

    auto const id = tree.register_new_id();
    EXPECT_TRUE(tree.is_unused_id(id));
    EXPECT_FALSE(tree.create_actor(id, account(0)).has_error());
    EXPECT_FALSE(tree.is_unused_id(id));
    EXPECT_EQ(
        tree.create_actor(id, account(0)).error(), ErrorNumber::Forbidden);

    // a deleted id stays used
    tree.delete_actor(id);
    EXPECT_EQ(
        tree.create_actor(id, account(0)).error(),
        ErrorNumber::IllegalArgument);
}

TEST(StateTree, fresh_ids_follow_checkpoints)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);

    tree.push();
    auto const reverted = tree.register_new_id();
    tree.pop_reject();
    EXPECT_FALSE(tree.is_unused_id(reverted));

    tree.push();
    auto const kept = tree.register_new_id();
    tree.push();
    EXPECT_FALSE(tree.create_actor(kept, account(1)).has_error());
    tree.pop_reject();
    // the outer reservation is back once the create is undone
    EXPECT_TRUE(tree.is_unused_id(kept));
    tree.pop_accept();
    EXPECT_TRUE(tree.is_unused_id(kept));

    // reservations end with the flush
    ASSERT_FALSE(tree.flush().has_error());
    EXPECT_FALSE(tree.is_unused_id(kept));
    EXPECT_EQ(
        tree.create_actor(kept, account(1)).error(),
        ErrorNumber::IllegalArgument);
}

TEST(StateTree, reserve_ids_only_raises)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    tree.reserve_ids_below(500);
    EXPECT_EQ(tree.next_actor_id(), 500);
    tree.reserve_ids_below(200);
    EXPECT_EQ(tree.next_actor_id(), 500);
}

TEST(StateTree, events_follow_checkpoints)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);

    tree.push();
    tree.emit_event({.emitter = 100, .data = byte_string{1}});
    tree.push();
    tree.emit_event({.emitter = 101, .data = byte_string{2}});
    tree.pop_reject();
    tree.push();
    tree.emit_event({.emitter = 102, .data = byte_string{3}});
    tree.pop_accept();
    tree.pop_accept();

    ASSERT_EQ(tree.events().size(), 2);
    EXPECT_EQ(tree.events()[0].emitter, 100);
    EXPECT_EQ(tree.events()[1].emitter, 102);

    tree.clear_events();
    EXPECT_TRUE(tree.events().empty());
}

TEST(StateTree, flush_clears_cache_of_writes)
{
    InMemoryBlockstore store;
    auto tree = StateTree::empty(store);
    tree.set_actor(100, account(1));
    tree.set_actor(101, account(1));
    EXPECT_EQ(tree.cached_entries(), 0);
    ASSERT_FALSE(tree.flush().has_error());
    EXPECT_EQ(tree.cached_entries(), 2);
    EXPECT_EQ(tree.get_actor(101).value(), account(1));
}
