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
#include <fvm/core/bytes_hash_compare.hpp>
#include <fvm/core/result.hpp>
#include <fvm/vm/compile_error.hpp>
#include <fvm/vm/compiler.hpp>
#include <fvm/vm/module.hpp>

#include <oneapi/tbb/concurrent_hash_map.h>

#include <cstddef>
#include <functional>
#include <span>
#include <utility>

namespace fvm::vm
{
    /// Compiled modules keyed by code hash. Lookups are concurrent and each
    /// distinct hash is compiled at most once; the outcome, success or
    /// failure, is kept for the lifetime of the cache.
    class ModuleCache
    {
        struct Entry
        {
            SharedModule module{};
            CompileError error{CompileError::Success};
        };

        using Map = tbb::concurrent_hash_map<
            bytes32_t, Entry, BytesHashCompare<bytes32_t>>;

        CompileOptions options_;
        Map map_;

    public:
        using CodeLoader = std::function<Result<byte_string>()>;

        explicit ModuleCache(CompileOptions const &);

        ModuleCache(ModuleCache const &) = delete;
        ModuleCache &operator=(ModuleCache const &) = delete;

        /// `load` runs only if the hash has not been seen before. A loader
        /// failure is returned as is and nothing is cached.
        Result<SharedModule>
        get_or_compile(bytes32_t const &code_hash, CodeLoader const &load);

        bool contains(bytes32_t const &code_hash) const;

        size_t size() const;

        /// Compile all of `codes` in parallel. Returns how many failed to
        /// compile; a pair whose hash is not the keccak of its code counts
        /// as a failure and is not cached.
        size_t
        warm(std::span<std::pair<bytes32_t, byte_string> const> codes);

        CompileOptions const &options() const noexcept
        {
            return options_;
        }
    };
}
