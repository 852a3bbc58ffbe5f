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
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/core/status_code.hpp>
#include <fvm/execution/call_manager/call_manager.hpp>
#include <fvm/execution/engine_config.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/kernel/kernel.hpp>
#include <fvm/execution/machine/machine.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/compile_error.hpp>
#include <fvm/vm/sandbox.hpp>
#include <fvm/vm/status.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <span>
#include <utility>

FVM_ANONYMOUS_NAMESPACE_BEGIN

InvocationResult exit_with(ExitCode const code)
{
    return {.exit_code = code};
}

// codes the system reserves for itself cannot be raised by actors
ExitCode guest_exit_code(uint64_t const code)
{
    if (code < FIRST_USER_EXIT_CODE || code > UINT32_MAX) {
        return ExitCode::SYS_ILLEGAL_EXIT_CODE;
    }
    return static_cast<ExitCode>(code);
}

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

CallManager::CallManager(Machine &machine, uint64_t const gas_limit)
    : machine_{machine}
    , gas_{gas_limit}
{
}

vm::MemoryGrant CallManager::reserve_memory(uint32_t const pages)
{
    auto const &engine = machine_.engine_config();
    if (FVM_UNLIKELY(
            memory_pages_ > engine.max_message_memory_pages ||
            pages > engine.max_message_memory_pages - memory_pages_)) {
        return vm::MemoryGrant::LimitExceeded;
    }
    if (gas_.charge(machine_.price_list().on_memory_grow(pages)).has_error()) {
        return vm::MemoryGrant::OutOfGas;
    }
    memory_pages_ += pages;
    return vm::MemoryGrant::Granted;
}

void CallManager::release_memory(uint32_t const pages) noexcept
{
    FVM_ASSERT(pages <= memory_pages_);
    memory_pages_ -= pages;
}

Result<InvocationResult> CallManager::send(
    ActorID const from, ActorID const to, MethodNum const method,
    byte_string_view const params, TokenAmount const &value)
{
    auto const &engine = machine_.engine_config();
    if (FVM_UNLIKELY(depth_ >= engine.max_call_depth)) {
        if (engine.depth_policy == DepthPolicy::AbortStack) {
            unwinding_ = true;
        }
        return exit_with(ExitCode::SYS_CALL_DEPTH_EXCEEDED);
    }

    auto &state = machine_.state_tree();
    state.push();
    ++depth_;
    auto result = invoke(from, to, method, params, value);
    --depth_;

    if (result.has_value() && is_success(result.value().exit_code)) {
        state.pop_accept();
    }
    else {
        state.pop_reject();
    }
    return result;
}

Result<InvocationResult> CallManager::invoke(
    ActorID const from, ActorID const to, MethodNum const method,
    byte_string_view const params, TokenAmount const &value)
{
    auto const &prices = machine_.price_list();
    if (gas_.charge(prices.on_method_invocation(value, method)).has_error()) {
        return exit_with(ExitCode::SYS_OUT_OF_GAS);
    }

    BOOST_OUTCOME_TRY(auto const transferred, transfer(from, to, value));
    if (!is_success(transferred.exit_code)) {
        return transferred;
    }
    if (method == METHOD_SEND) {
        return exit_with(ExitCode::OK);
    }

    BOOST_OUTCOME_TRY(
        auto const receiver, machine_.state_tree().get_actor(to));
    if (!receiver->has_code()) {
        return exit_with(ExitCode::USR_UNHANDLED_MESSAGE);
    }
    return run(from, to, method, params, value, receiver->code_hash);
}

Result<InvocationResult> CallManager::transfer(
    ActorID const from, ActorID const to, TokenAmount const &value)
{
    auto &state = machine_.state_tree();

    BOOST_OUTCOME_TRY(auto sender, state.get_actor(from));
    if (value != 0 && (!sender.has_value() || sender->balance < value)) {
        return exit_with(ExitCode::SYS_INSUFFICIENT_FUNDS);
    }
    BOOST_OUTCOME_TRY(auto receiver, state.get_actor(to));
    if (!receiver.has_value()) {
        return exit_with(ExitCode::SYS_INVALID_RECEIVER);
    }
    if (value == 0 || from == to) {
        return exit_with(ExitCode::OK);
    }

    sender->balance -= value;
    receiver->balance += value;
    state.set_actor(from, *sender);
    state.set_actor(to, *receiver);
    return exit_with(ExitCode::OK);
}

Result<InvocationResult> CallManager::run(
    ActorID const from, ActorID const to, MethodNum const method,
    byte_string_view const params, TokenAmount const &value,
    bytes32_t const &code_hash)
{
    auto &store = machine_.blockstore();
    auto module = machine_.module_cache().get_or_compile(
        code_hash, [&]() -> Result<byte_string> {
            auto code = store.get(code_hash);
            if (FVM_UNLIKELY(!code.has_value())) {
                return ExecutionError::MissingBlock;
            }
            return std::move(code).value();
        });
    if (module.has_error()) {
        // bad code is the actor's fault, a missing block is not
        if (error_value<vm::CompileError>(module.assume_error())) {
            return exit_with(ExitCode::SYS_ILLEGAL_INSTRUCTION);
        }
        return std::move(module).as_failure();
    }

    auto const entry = module.value()->entry_point(method);
    if (!entry.has_value()) {
        return exit_with(ExitCode::USR_UNHANDLED_MESSAGE);
    }

    auto const &engine = machine_.engine_config();
    Kernel kernel{*this, from, to, method, value, params};
    switch (kernel.grow_memory(module.value()->min_pages())) {
    case vm::MemoryGrant::Granted:
        break;
    case vm::MemoryGrant::OutOfGas:
        return exit_with(ExitCode::SYS_OUT_OF_GAS);
    case vm::MemoryGrant::LimitExceeded:
        return exit_with(ExitCode::SYS_MEMORY_LIMIT_EXCEEDED);
    }
    vm::Sandbox sandbox{
        std::move(module).value(),
        {.max_memory_pages = engine.max_memory_pages,
         .max_stack_depth = engine.max_stack_depth},
        [this](uint64_t const cost) {
            return gas_.charge({"exec", cost}).has_value();
        },
        kernel};

    uint64_t const params_handle = kernel.params_handle();
    auto exec = sandbox.run(*entry, {&params_handle, 1});

    switch (exec.status) {
    case vm::StatusCode::Success:
        return InvocationResult{
            .exit_code = ExitCode::OK, .return_data = std::move(exec.output)};
    case vm::StatusCode::Abort:
        if (auto const forced = kernel.forced_exit()) {
            return exit_with(*forced);
        }
        return exit_with(guest_exit_code(exec.abort_code));
    case vm::StatusCode::OutOfGas:
        return exit_with(ExitCode::SYS_OUT_OF_GAS);
    case vm::StatusCode::MemoryLimitExceeded:
        return exit_with(ExitCode::SYS_MEMORY_LIMIT_EXCEEDED);
    case vm::StatusCode::HostFailure: {
        BOOST_OUTCOME_TRY(kernel.take_fatal());
        FVM_ABORT("host failure without an error");
    }
    case vm::StatusCode::StackOverflow:
    case vm::StatusCode::StackUnderflow:
    case vm::StatusCode::MemoryOutOfBounds:
    case vm::StatusCode::DivisionByZero:
        break;
    }
    return exit_with(ExitCode::SYS_ILLEGAL_INSTRUCTION);
}

FVM_NAMESPACE_END
