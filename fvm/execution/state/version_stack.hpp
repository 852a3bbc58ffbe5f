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

#include <fvm/core/assert.h>
#include <fvm/core/config.hpp>

#include <cstddef>
#include <utility>
#include <vector>

FVM_NAMESPACE_BEGIN

/// A value with one copy per open checkpoint that modified it. `version`
/// is the checkpoint depth at which a copy was made.
template <class T>
class VersionStack
{
    std::vector<std::pair<unsigned, T>> stack_{};

public:
    explicit VersionStack(T value, unsigned const version = 0)
    {
        stack_.emplace_back(version, std::move(value));
    }

    VersionStack(VersionStack &&) = default;
    VersionStack(VersionStack const &) = delete;
    VersionStack &operator=(VersionStack &&) = default;
    VersionStack &operator=(VersionStack const &) = delete;

    size_t size() const
    {
        return stack_.size();
    }

    unsigned version() const
    {
        FVM_ASSERT(!stack_.empty());
        return stack_.back().first;
    }

    T const &recent() const
    {
        FVM_ASSERT(!stack_.empty());
        return stack_.back().second;
    }

    /// Mutable copy owned by checkpoint `version`, made on first write.
    T &current(unsigned const version)
    {
        FVM_ASSERT(!stack_.empty());
        if (version > stack_.back().first) {
            T copy = stack_.back().second;
            stack_.emplace_back(version, std::move(copy));
        }
        return stack_.back().second;
    }

    /// Fold checkpoint `version` into its parent.
    void pop_accept(unsigned const version)
    {
        FVM_ASSERT(version > 0);
        FVM_ASSERT(!stack_.empty());

        auto &top = stack_.back();
        if (top.first != version) {
            return;
        }
        auto const n = stack_.size();
        if (n > 1 && stack_[n - 2].first == version - 1) {
            stack_[n - 2].second = std::move(top.second);
            stack_.pop_back();
        }
        else {
            top.first = version - 1;
        }
    }

    /// Discard checkpoint `version`. Returns true when no copy remains and
    /// the owner may drop the stack.
    bool pop_reject(unsigned const version)
    {
        FVM_ASSERT(version > 0);
        FVM_ASSERT(!stack_.empty());

        if (stack_.back().first == version) {
            stack_.pop_back();
        }
        return stack_.empty();
    }
};

FVM_NAMESPACE_END
