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

#include <fvm/core/assert.h>
#include <fvm/core/byte_string.hpp>
#include <fvm/core/bytes.hpp>
#include <fvm/core/keccak.hpp>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/core/rlp/decode.hpp>
#include <fvm/core/rlp/decode_error.hpp>
#include <fvm/core/rlp/encode.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/event.hpp>
#include <fvm/execution/state/actor_rlp.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

FVM_ANONYMOUS_NAMESPACE_BEGIN

byte_string
encode_index(ActorID const next_id, std::map<ActorID, bytes32_t> const &index)
{
    std::vector<byte_string> entries;
    entries.reserve(index.size());
    for (auto const &[id, hash] : index) {
        entries.emplace_back(rlp::encode_list(
            rlp::encode_unsigned(id), rlp::encode_bytes32(hash)));
    }
    return rlp::encode_list(
        rlp::encode_unsigned(next_id), rlp::encode_list(entries));
}

Result<ActorID>
decode_index(byte_string_view enc, std::map<ActorID, bytes32_t> &index)
{
    BOOST_OUTCOME_TRY(auto payload, rlp::parse_list_metadata(enc));
    if (FVM_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    BOOST_OUTCOME_TRY(
        auto const next_id, rlp::decode_unsigned<ActorID>(payload));
    BOOST_OUTCOME_TRY(auto entries, rlp::parse_list_metadata(payload));
    if (FVM_UNLIKELY(!payload.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    while (!entries.empty()) {
        BOOST_OUTCOME_TRY(auto entry, rlp::parse_list_metadata(entries));
        BOOST_OUTCOME_TRY(
            auto const id, rlp::decode_unsigned<ActorID>(entry));
        BOOST_OUTCOME_TRY(auto const hash, rlp::decode_bytes32(entry));
        if (FVM_UNLIKELY(!entry.empty())) {
            return rlp::DecodeError::InputTooLong;
        }
        // ids are strictly ascending in a canonical index
        if (FVM_UNLIKELY(!index.empty() && id <= index.rbegin()->first)) {
            return ExecutionError::CorruptState;
        }
        index.emplace_hint(index.end(), id, hash);
    }
    return next_id;
}

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

StateTree::StateTree(Blockstore &store, ActorID const next_id)
    : store_{store}
    , next_id_{next_id}
    , unused_ids_{ankerl::unordered_dense::set<ActorID>{}}
    , events_{std::vector<ActorEvent>{}}
{
}

StateTree StateTree::empty(Blockstore &store)
{
    StateTree tree{store, FIRST_NON_SINGLETON_ADDR};
    tree.root_ = to_bytes(
        keccak256(encode_index(FIRST_NON_SINGLETON_ADDR, tree.index_)));
    return tree;
}

Result<StateTree> StateTree::load(Blockstore &store, bytes32_t const &root)
{
    auto const block = store.get(root);
    if (FVM_UNLIKELY(!block.has_value())) {
        return ExecutionError::MissingBlock;
    }
    std::map<ActorID, bytes32_t> index;
    BOOST_OUTCOME_TRY(auto const next_id, decode_index(*block, index));

    StateTree tree{store, next_id};
    tree.index_ = std::move(index);
    tree.root_ = root;
    return tree;
}

Result<std::optional<ActorState>> StateTree::original_actor(ActorID const id)
{
    if (auto const it = original_.find(id); it != original_.end()) {
        return it->second;
    }

    std::optional<ActorState> actor;
    if (auto const it = index_.find(id); it != index_.end()) {
        auto const block = store_.get(it->second);
        if (FVM_UNLIKELY(!block.has_value())) {
            return ExecutionError::MissingBlock;
        }
        byte_string_view enc{*block};
        BOOST_OUTCOME_TRY(actor, rlp::decode_actor_state(enc));
        if (FVM_UNLIKELY(!enc.empty())) {
            return rlp::DecodeError::InputTooLong;
        }
    }
    original_.emplace(id, actor);
    return actor;
}

std::optional<ActorState> &StateTree::current_actor(ActorID const id)
{
    auto it = current_.find(id);
    if (it == current_.end()) {
        it = current_
                 .try_emplace(id, std::optional<ActorState>{}, version_)
                 .first;
    }
    return it->second.current(version_);
}

void StateTree::push()
{
    ++version_;
}

void StateTree::pop_accept()
{
    FVM_ASSERT(version_ > 0);

    for (auto &[id, stack] : current_) {
        stack.pop_accept(version_);
    }
    next_id_.pop_accept(version_);
    unused_ids_.pop_accept(version_);
    events_.pop_accept(version_);

    --version_;
}

void StateTree::pop_reject()
{
    FVM_ASSERT(version_ > 0);

    std::vector<ActorID> dropped;
    for (auto &[id, stack] : current_) {
        if (stack.pop_reject(version_)) {
            dropped.push_back(id);
        }
    }
    for (auto const id : dropped) {
        current_.erase(id);
    }
    bool const no_next_id = next_id_.pop_reject(version_);
    FVM_ASSERT(!no_next_id);
    bool const no_unused_ids = unused_ids_.pop_reject(version_);
    FVM_ASSERT(!no_unused_ids);
    bool const no_events = events_.pop_reject(version_);
    FVM_ASSERT(!no_events);

    --version_;
}

Result<std::optional<ActorState>> StateTree::get_actor(ActorID const id)
{
    if (auto const it = current_.find(id); it != current_.end()) {
        return it->second.recent();
    }
    return original_actor(id);
}

void StateTree::set_actor(ActorID const id, ActorState const &actor)
{
    current_actor(id) = actor;
}

void StateTree::delete_actor(ActorID const id)
{
    current_actor(id).reset();
}

Result<void> StateTree::create_actor(ActorID const id, ActorState const &actor)
{
    BOOST_OUTCOME_TRY(auto const existing, get_actor(id));
    if (existing.has_value()) {
        return ErrorNumber::Forbidden;
    }
    if (!is_unused_id(id)) {
        return ErrorNumber::IllegalArgument;
    }
    unused_ids_.current(version_).erase(id);
    set_actor(id, actor);
    return outcome::success();
}

ActorID StateTree::register_new_id()
{
    ActorID const id = next_id_.current(version_)++;
    unused_ids_.current(version_).insert(id);
    return id;
}

bool StateTree::is_unused_id(ActorID const id) const
{
    return unused_ids_.recent().contains(id);
}

ActorID StateTree::next_actor_id() const
{
    return next_id_.recent();
}

void StateTree::reserve_ids_below(ActorID const id)
{
    auto &next_id = next_id_.current(version_);
    next_id = std::max(next_id, id);
}

void StateTree::emit_event(ActorEvent event)
{
    events_.current(version_).push_back(std::move(event));
}

std::vector<ActorEvent> const &StateTree::events() const
{
    return events_.recent();
}

void StateTree::clear_events()
{
    FVM_ASSERT(version_ == 0);
    events_.current(0).clear();
}

Result<bytes32_t> StateTree::flush()
{
    FVM_ASSERT(version_ == 0);
    unused_ids_.current(0).clear();

    for (auto &[id, stack] : current_) {
        FVM_ASSERT(stack.size() == 1);
        auto const &actor = stack.recent();
        if (actor.has_value()) {
            index_[id] = store_.put(rlp::encode_actor_state(*actor));
        }
        else {
            index_.erase(id);
        }
        original_[id] = actor;
    }
    current_.clear();

    root_ = store_.put(encode_index(next_id_.recent(), index_));
    return root_;
}

FVM_NAMESPACE_END
