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

#include <fvm/core/bytes.hpp>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/execution/engine_config.hpp>
#include <fvm/execution/executor/executor.hpp>
#include <fvm/execution/externs.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/kernel/syscalls.hpp>
#include <fvm/execution/machine/machine.hpp>
#include <fvm/execution/machine/machine_config.hpp>
#include <fvm/execution/machine/machine_error.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/vm/compiler.hpp>

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>

#include <quill/Quill.h>

#include <memory>
#include <span>
#include <utility>

FVM_NAMESPACE_BEGIN

Machine::Machine(
    MachineConfig const &config, PriceList const &prices,
    EngineConfig const &engine,
    std::span<vm::SyscallSignature const> const syscalls, Blockstore &store,
    Externs &externs, CryptoOracle &oracle, StateTree state)
    : config_{config}
    , prices_{prices}
    , engine_{engine}
    , syscalls_{syscalls}
    , store_{store}
    , externs_{externs}
    , oracle_{oracle}
    , state_{std::move(state)}
    , module_cache_{vm::CompileOptions{
          .costs = prices.instructions,
          .syscalls = syscalls,
          .max_memory_pages = engine.max_memory_pages,
          .max_code_size = engine.max_code_size}}
{
}

Result<std::unique_ptr<Machine>> Machine::create(
    MachineConfig const &config, Blockstore &store, Externs &externs,
    CryptoOracle &oracle)
{
    auto const *const prices = price_list_by_version(config.network_version);
    auto const *const engine =
        engine_config_by_version(config.network_version);
    auto const syscalls = syscall_table(config.network_version);
    if (FVM_UNLIKELY(
            prices == nullptr || engine == nullptr || syscalls.empty())) {
        LOG_ERROR(
            "unsupported network version {}",
            static_cast<uint32_t>(config.network_version));
        return MachineError::UnsupportedNetworkVersion;
    }

    auto loaded = [&]() -> Result<StateTree> {
        if (config.state_root.has_value()) {
            return StateTree::load(store, *config.state_root);
        }
        return StateTree::empty(store);
    }();
    BOOST_OUTCOME_TRY(auto state, std::move(loaded));

    LOG_INFO(
        "machine created: network version {}, epoch {}, state root {}",
        static_cast<uint32_t>(config.network_version),
        config.epoch,
        evmc::hex(state.root()));

    return std::unique_ptr<Machine>(new Machine(
        config,
        *prices,
        config.engine.value_or(*engine),
        syscalls,
        store,
        externs,
        oracle,
        std::move(state)));
}

Executor Machine::new_executor()
{
    return Executor{*this};
}

Result<bytes32_t> Machine::flush()
{
    return state_.flush();
}

FVM_NAMESPACE_END
