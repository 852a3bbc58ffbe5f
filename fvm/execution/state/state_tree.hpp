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
#include <fvm/core/result.hpp>
#include <fvm/execution/event.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/version_stack.hpp>
#include <fvm/execution/types.hpp>

#include <ankerl/unordered_dense.h>

#include <map>
#include <optional>
#include <vector>

FVM_NAMESPACE_BEGIN

/// Actor table over a content addressed store. Committed entries are read
/// through once and cached; writes live in version stacks until `flush`.
class StateTree
{
    template <typename K, typename V>
    using Map = ankerl::unordered_dense::segmented_map<K, V>;

    Blockstore &store_;

    // actor id to entry hash, as of the last flush
    std::map<ActorID, bytes32_t> index_{};

    Map<ActorID, std::optional<ActorState>> original_{};

    Map<ActorID, VersionStack<std::optional<ActorState>>> current_{};

    VersionStack<ActorID> next_id_;

    // handed out by `register_new_id` and not yet created; dropped on flush
    VersionStack<ankerl::unordered_dense::set<ActorID>> unused_ids_;

    VersionStack<std::vector<ActorEvent>> events_;

    bytes32_t root_{};

    unsigned version_{0};

    StateTree(Blockstore &, ActorID next_id);

    Result<std::optional<ActorState>> original_actor(ActorID);

    std::optional<ActorState> &current_actor(ActorID);

public:
    /// A tree with no actors, not yet written to the store.
    static StateTree empty(Blockstore &);

    static Result<StateTree> load(Blockstore &, bytes32_t const &root);

    StateTree(StateTree &&) = default;
    StateTree(StateTree const &) = delete;
    StateTree &operator=(StateTree &&) = delete;
    StateTree &operator=(StateTree const &) = delete;

    Blockstore &store() noexcept
    {
        return store_;
    }

    unsigned version() const noexcept
    {
        return version_;
    }

    void push();

    void pop_accept();

    void pop_reject();

    ////////////////////////////////////////

    Result<std::optional<ActorState>> get_actor(ActorID);

    void set_actor(ActorID, ActorState const &);

    void delete_actor(ActorID);

    /// Fails with `ErrorNumber::Forbidden` if the id is taken and with
    /// `ErrorNumber::IllegalArgument` unless `register_new_id` returned it
    /// since the last flush. Each such id can be used once.
    Result<void> create_actor(ActorID, ActorState const &);

    /// Reserve a fresh id; the reservation is undone by a revert.
    ActorID register_new_id();

    bool is_unused_id(ActorID id) const;

    ActorID next_actor_id() const;

    /// Make sure no id below `id` is handed out again.
    void reserve_ids_below(ActorID id);

    ////////////////////////////////////////

    void emit_event(ActorEvent);

    std::vector<ActorEvent> const &events() const;

    void clear_events();

    ////////////////////////////////////////

    /// Write every changed entry and the actor index. Only valid with no
    /// open checkpoint.
    Result<bytes32_t> flush();

    /// Root as of the last flush or load.
    bytes32_t const &root() const noexcept
    {
        return root_;
    }

    /// Number of actor entries fetched from the store so far.
    size_t cached_entries() const noexcept
    {
        return original_.size();
    }
};

FVM_NAMESPACE_END
