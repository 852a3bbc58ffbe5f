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

#include <fvm/core/config.hpp>
#include <fvm/execution/types.hpp>

#include <cstddef>
#include <cstdint>

FVM_NAMESPACE_BEGIN

enum class DepthPolicy : uint8_t
{
    // the immediate caller sees SYS_CALL_DEPTH_EXCEEDED and may continue
    Recoverable,
    // every frame on the stack aborts with SYS_CALL_DEPTH_EXCEEDED
    AbortStack,
};

/// Sandbox and call stack limits of one network version.
struct EngineConfig
{
    uint32_t max_call_depth;
    DepthPolicy depth_policy;
    // per instance
    uint32_t max_memory_pages;
    // summed over every live instance of one message
    uint32_t max_message_memory_pages;
    uint32_t max_stack_depth;
    size_t max_block_size;
    size_t max_code_size;
};

/// nullptr if the version has no engine configuration.
EngineConfig const *engine_config_by_version(NetworkVersion);

FVM_NAMESPACE_END
