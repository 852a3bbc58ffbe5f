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
#include <fvm/execution/engine_config.hpp>
#include <fvm/execution/types.hpp>

FVM_ANONYMOUS_NAMESPACE_BEGIN

constexpr EngineConfig V1_ENGINE{
    .max_call_depth = 1024,
    .depth_policy = DepthPolicy::Recoverable,
    .max_memory_pages = 512,
    .max_message_memory_pages = 2048,
    .max_stack_depth = 1024,
    .max_block_size = 1 << 20,
    .max_code_size = 1 << 20,
};

constexpr EngineConfig V2_ENGINE{
    .max_call_depth = 1024,
    .depth_policy = DepthPolicy::AbortStack,
    .max_memory_pages = 1024,
    .max_message_memory_pages = 4096,
    .max_stack_depth = 1024,
    .max_block_size = 1 << 20,
    .max_code_size = 2 << 20,
};

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

EngineConfig const *engine_config_by_version(NetworkVersion const version)
{
    switch (version) {
    case NetworkVersion::V1:
        return &V1_ENGINE;
    case NetworkVersion::V2:
        return &V2_ENGINE;
    }
    return nullptr;
}

FVM_NAMESPACE_END
