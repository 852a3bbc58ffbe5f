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
#include <fvm/core/status_code.hpp>
#include <fvm/vm/compile_error.hpp>
#include <fvm/vm/compiler.hpp>
#include <fvm/vm/module_cache.hpp>

#include <evmc/hex.hpp>

#include <oneapi/tbb/parallel_for_each.h>

#include <quill/Quill.h>

#include <atomic>
#include <cstddef>
#include <span>
#include <string>
#include <utility>

namespace fvm::vm
{
    ModuleCache::ModuleCache(CompileOptions const &options)
        : options_{options}
    {
    }

    Result<SharedModule> ModuleCache::get_or_compile(
        bytes32_t const &code_hash, CodeLoader const &load)
    {
        {
            Map::const_accessor acc;
            if (map_.find(acc, code_hash)) {
                if (acc->second.module) {
                    return acc->second.module;
                }
                return acc->second.error;
            }
        }

        Map::accessor acc;
        if (!map_.insert(acc, code_hash)) {
            // compiled by another thread while we waited for the lock
            if (acc->second.module) {
                return acc->second.module;
            }
            return acc->second.error;
        }

        auto code = load();
        if (code.has_error()) {
            map_.erase(acc);
            return std::move(code).as_failure();
        }

        auto compiled = compile(code.value(), options_);
        if (compiled.has_error()) {
            auto const error =
                error_value<CompileError>(compiled.assume_error());
            FVM_ASSERT(error.has_value());
            LOG_WARNING(
                "compilation of {} failed: {}",
                evmc::hex(code_hash),
                std::string{compiled.assume_error().message().c_str()});
            acc->second.error = error.value();
            return error.value();
        }
        acc->second.module = compiled.value();
        return acc->second.module;
    }

    bool ModuleCache::contains(bytes32_t const &code_hash) const
    {
        Map::const_accessor acc;
        return map_.find(acc, code_hash);
    }

    size_t ModuleCache::size() const
    {
        return map_.size();
    }

    size_t ModuleCache::warm(
        std::span<std::pair<bytes32_t, byte_string> const> const codes)
    {
        std::atomic<size_t> failures{0};
        tbb::parallel_for_each(
            codes.begin(), codes.end(), [&](auto const &entry) {
                auto const &[hash, code] = entry;
                if (FVM_UNLIKELY(to_bytes(keccak256(code)) != hash)) {
                    LOG_WARNING(
                        "not warming {}: hash does not match the code",
                        evmc::hex(hash));
                    failures.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
                auto const result =
                    get_or_compile(hash, [&code]() -> Result<byte_string> {
                        return code;
                    });
                if (result.has_error()) {
                    failures.fetch_add(1, std::memory_order_relaxed);
                }
            });
        return failures.load();
    }
}
