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
#include <fvm/execution/engine_config.hpp>
#include <fvm/execution/externs.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/machine/machine_config.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/module_cache.hpp>

#include <memory>
#include <span>

FVM_NAMESPACE_BEGIN

class Executor;

/// Execution context of a batch of messages: one state tree, one module
/// cache and one gas schedule, all fixed at construction. Independent
/// machines share nothing.
class Machine
{
    MachineConfig config_;
    PriceList const &prices_;
    EngineConfig engine_;
    std::span<vm::SyscallSignature const> syscalls_;
    Blockstore &store_;
    Externs &externs_;
    CryptoOracle &oracle_;
    StateTree state_;
    vm::ModuleCache module_cache_;

    Machine(
        MachineConfig const &, PriceList const &, EngineConfig const &,
        std::span<vm::SyscallSignature const>, Blockstore &, Externs &,
        CryptoOracle &, StateTree);

public:
    static Result<std::unique_ptr<Machine>> create(
        MachineConfig const &, Blockstore &, Externs &, CryptoOracle &);

    Machine(Machine const &) = delete;
    Machine &operator=(Machine const &) = delete;

    Executor new_executor();

    /// Root of the committed state.
    Result<bytes32_t> flush();

    MachineConfig const &config() const noexcept
    {
        return config_;
    }

    PriceList const &price_list() const noexcept
    {
        return prices_;
    }

    EngineConfig const &engine_config() const noexcept
    {
        return engine_;
    }

    std::span<vm::SyscallSignature const> syscalls() const noexcept
    {
        return syscalls_;
    }

    Blockstore &blockstore() noexcept
    {
        return store_;
    }

    Externs &externs() noexcept
    {
        return externs_;
    }

    CryptoOracle &crypto() noexcept
    {
        return oracle_;
    }

    StateTree &state_tree() noexcept
    {
        return state_;
    }

    vm::ModuleCache &module_cache() noexcept
    {
        return module_cache_;
    }
};

FVM_NAMESPACE_END
