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
#include <fvm/core/blake3.hpp>
#include <fvm/core/byte_string.hpp>
#include <fvm/core/bytes.hpp>
#include <fvm/core/int.hpp>
#include <fvm/core/keccak.hpp>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/core/status_code.hpp>
#include <fvm/execution/call_manager/call_manager.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/event.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/externs.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/kernel/block_registry.hpp>
#include <fvm/execution/kernel/kernel.hpp>
#include <fvm/execution/kernel/syscalls.hpp>
#include <fvm/execution/machine/machine.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/vm/host.hpp>
#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <bit>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

FVM_ANONYMOUS_NAMESPACE_BEGIN

Result<byte_string_view>
read_memory(vm::Memory const &memory, uint64_t const ptr, uint64_t const len)
{
    if (FVM_UNLIKELY(!memory.in_bounds(ptr, len))) {
        return ErrorNumber::IllegalArgument;
    }
    return memory.view(ptr, len);
}

Result<std::span<uint8_t>>
output_memory(vm::Memory &memory, uint64_t const ptr, uint64_t const len)
{
    if (FVM_UNLIKELY(!memory.in_bounds(ptr, len))) {
        return ErrorNumber::IllegalArgument;
    }
    return memory.span(ptr, len);
}

Result<bytes32_t> read_bytes32(vm::Memory const &memory, uint64_t const ptr)
{
    BOOST_OUTCOME_TRY(
        auto const bytes, read_memory(memory, ptr, sizeof(bytes32_t)));
    return to_bytes(bytes);
}

Result<TokenAmount> read_amount(vm::Memory const &memory, uint64_t const ptr)
{
    BOOST_OUTCOME_TRY(
        auto const bytes, read_memory(memory, ptr, sizeof(TokenAmount)));
    return intx::be::unsafe::load<uint256_t>(bytes.data());
}

void write_bytes32(std::span<uint8_t> const out, bytes32_t const &value)
{
    FVM_ASSERT(out.size() == sizeof(bytes32_t));
    std::copy_n(value.bytes, sizeof(bytes32_t), out.begin());
}

void write_amount(std::span<uint8_t> const out, TokenAmount const &value)
{
    FVM_ASSERT(out.size() == sizeof(TokenAmount));
    intx::be::unsafe::store(out.data(), value);
}

void append_be64(byte_string &out, uint64_t const value)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>(value >> shift));
    }
}

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

Kernel::Kernel(
    CallManager &call_manager, ActorID const caller, ActorID const receiver,
    MethodNum const method, TokenAmount const &value,
    byte_string_view const params)
    : call_manager_{call_manager}
    , caller_{caller}
    , receiver_{receiver}
    , method_{method}
    , value_{value}
{
    if (!params.empty()) {
        auto handle = blocks_.put(byte_string{params});
        FVM_ASSERT(handle.has_value());
        params_ = handle.value();
    }
}

Kernel::~Kernel()
{
    call_manager_.release_memory(memory_pages_);
}

vm::MemoryGrant Kernel::grow_memory(uint32_t const pages)
{
    auto const grant = call_manager_.reserve_memory(pages);
    if (grant == vm::MemoryGrant::Granted) {
        memory_pages_ += pages;
    }
    return grant;
}

Result<void> Kernel::take_fatal()
{
    FVM_ASSERT(fatal_.has_error());
    Result<void> fatal = std::move(fatal_);
    fatal_ = outcome::success();
    return fatal;
}

Result<void> Kernel::charge(GasCharge const &gas)
{
    return call_manager_.gas().charge(gas);
}

Result<ActorState> Kernel::self_state()
{
    auto &state = call_manager_.machine().state_tree();
    BOOST_OUTCOME_TRY(auto const actor, state.get_actor(receiver_));
    if (FVM_UNLIKELY(!actor.has_value())) {
        // deleted earlier in this frame
        return ErrorNumber::IllegalOperation;
    }
    return actor.value();
}

vm::SyscallResult Kernel::syscall(
    vm::SyscallSignature const &sig, std::span<uint64_t const> const args,
    vm::Memory &memory)
{
    auto result = [&]() -> Result<Values> {
        auto const &prices = call_manager_.machine().price_list();
        BOOST_OUTCOME_TRY(charge(prices.on_syscall()));
        return dispatch(static_cast<Syscall>(sig.id), args, memory);
    }();

    if (result.has_error()) {
        auto const &error = result.assume_error();
        if (auto const errnum = error_value<ErrorNumber>(error)) {
            return {.error = static_cast<uint64_t>(*errnum)};
        }
        if (error_value<ExecutionError>(error) == ExecutionError::OutOfGas) {
            return {.status = vm::SyscallStatus::OutOfGas};
        }
        fatal_ = std::move(result).as_failure();
        return {.status = vm::SyscallStatus::Fatal};
    }

    if (FVM_UNLIKELY(call_manager_.unwinding())) {
        forced_exit_ = ExitCode::SYS_CALL_DEPTH_EXCEEDED;
        return {
            .values = {static_cast<uint64_t>(*forced_exit_)},
            .status = vm::SyscallStatus::Abort};
    }

    return {.values = result.value()};
}

Result<Kernel::Values>
Kernel::dispatch(Syscall const id, Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    auto const &config = machine.config();

    switch (id) {
    case Syscall::CALLER:
        return Values{caller_};
    case Syscall::RECEIVER:
        return Values{receiver_};
    case Syscall::METHOD_NUMBER:
        return Values{method_};
    case Syscall::VALUE_RECEIVED:
        return value_received(args, memory);

    case Syscall::ROOT:
        return root(args, memory);
    case Syscall::SET_ROOT:
        return set_root(args, memory);
    case Syscall::CURRENT_BALANCE:
        return current_balance(args, memory);
    case Syscall::SELF_DESTRUCT:
        return self_destruct(args);

    case Syscall::BLOCK_OPEN:
        return block_open(args, memory);
    case Syscall::BLOCK_CREATE:
        return block_create(args, memory);
    case Syscall::BLOCK_READ:
        return block_read(args, memory);
    case Syscall::BLOCK_STAT:
        return block_stat(args);
    case Syscall::BLOCK_LINK:
        return block_link(args, memory);

    case Syscall::GET_ACTOR_CODE_HASH:
        return get_actor_code_hash(args, memory);
    case Syscall::CREATE_ACTOR:
        return create_actor(args, memory);
    case Syscall::NEXT_ACTOR_ID:
        return Values{machine.state_tree().register_new_id()};

    case Syscall::SEND:
        return send(args, memory);

    case Syscall::GET_CHAIN_RANDOMNESS:
    case Syscall::GET_BEACON_RANDOMNESS:
        return get_randomness(id, args, memory);

    case Syscall::HASH:
        return hash(args, memory);
    case Syscall::VERIFY:
        return verify(args, memory);

    case Syscall::CHARGE_GAS: {
        BOOST_OUTCOME_TRY(charge({"charge_gas", args[0]}));
        return Values{};
    }
    case Syscall::AVAILABLE:
        return Values{call_manager_.gas().available()};

    case Syscall::EPOCH:
        return Values{std::bit_cast<uint64_t>(config.epoch)};
    case Syscall::VERSION:
        return Values{static_cast<uint64_t>(config.network_version)};
    case Syscall::BASE_FEE: {
        BOOST_OUTCOME_TRY(
            auto const out,
            output_memory(memory, args[0], sizeof(TokenAmount)));
        write_amount(out, config.base_fee);
        return Values{};
    }
    case Syscall::CHAIN_ID:
        return Values{config.chain_id};

    case Syscall::EMIT_EVENT:
        return emit_event(args, memory);

    case Syscall::LOG:
        return log(args, memory);
    }
    // the compiler links only ids from the syscall table
    FVM_ABORT("unlinked syscall");
}

Result<Kernel::Values>
Kernel::value_received(Args const args, vm::Memory &memory)
{
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[0], sizeof(TokenAmount)));
    write_amount(out, value_);
    return Values{};
}

Result<Kernel::Values> Kernel::root(Args const args, vm::Memory &memory)
{
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[0], sizeof(bytes32_t)));
    BOOST_OUTCOME_TRY(auto const actor, self_state());
    write_bytes32(out, actor.state_root);
    return Values{};
}

Result<Kernel::Values> Kernel::set_root(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    BOOST_OUTCOME_TRY(auto const new_root, read_bytes32(memory, args[0]));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_set_root()));
    BOOST_OUTCOME_TRY(auto actor, self_state());
    // a root must reference a block the store holds
    if (new_root != NULL_HASH &&
        !machine.blockstore().get(new_root).has_value()) {
        return ErrorNumber::NotFound;
    }
    actor.state_root = new_root;
    machine.state_tree().set_actor(receiver_, actor);
    return Values{};
}

Result<Kernel::Values>
Kernel::current_balance(Args const args, vm::Memory &memory)
{
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[0], sizeof(TokenAmount)));
    BOOST_OUTCOME_TRY(auto const actor, self_state());
    write_amount(out, actor.balance);
    return Values{};
}

Result<Kernel::Values> Kernel::self_destruct(Args const args)
{
    auto &machine = call_manager_.machine();
    auto &state = machine.state_tree();
    ActorID const beneficiary = args[0];

    BOOST_OUTCOME_TRY(charge(machine.price_list().on_self_destruct()));
    BOOST_OUTCOME_TRY(auto const actor, self_state());
    // the balance has to land somewhere that survives the actor
    if (beneficiary == receiver_) {
        return ErrorNumber::IllegalArgument;
    }
    BOOST_OUTCOME_TRY(auto heir, state.get_actor(beneficiary));
    if (!heir.has_value()) {
        return ErrorNumber::NotFound;
    }
    heir->balance += actor.balance;
    state.set_actor(beneficiary, *heir);
    state.delete_actor(receiver_);
    return Values{};
}

Result<Kernel::Values> Kernel::block_open(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    BOOST_OUTCOME_TRY(auto const hash, read_bytes32(memory, args[0]));

    byte_string data;
    if (hash != NULL_HASH) {
        auto block = machine.blockstore().get(hash);
        if (!block.has_value()) {
            BOOST_OUTCOME_TRY(auto const actor, self_state());
            // the actor's own state must always be present
            if (FVM_UNLIKELY(hash == actor.state_root)) {
                return ExecutionError::MissingBlock;
            }
            return ErrorNumber::NotFound;
        }
        data = std::move(block).value();
    }

    BOOST_OUTCOME_TRY(charge(machine.price_list().on_block_open(data.size())));
    uint64_t const size = data.size();
    BOOST_OUTCOME_TRY(auto const handle, blocks_.put(std::move(data)));
    return Values{handle, size};
}

Result<Kernel::Values>
Kernel::block_create(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    uint64_t const len = args[1];
    if (FVM_UNLIKELY(len > machine.engine_config().max_block_size)) {
        return ErrorNumber::LimitExceeded;
    }
    BOOST_OUTCOME_TRY(auto const data, read_memory(memory, args[0], len));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_block_create(len)));
    BOOST_OUTCOME_TRY(auto const handle, blocks_.put(byte_string{data}));
    return Values{handle};
}

Result<Kernel::Values> Kernel::block_read(Args const args, vm::Memory &memory)
{
    auto const &prices = call_manager_.machine().price_list();
    uint64_t const offset = args[1];

    BOOST_OUTCOME_TRY(auto const *const block, blocks_.get(args[0]));
    if (FVM_UNLIKELY(offset > block->size())) {
        return ErrorNumber::IllegalArgument;
    }
    uint64_t const copied = std::min(args[3], block->size() - offset);
    BOOST_OUTCOME_TRY(auto const out, output_memory(memory, args[2], copied));
    BOOST_OUTCOME_TRY(charge(prices.on_block_read(copied)));
    std::copy_n(block->data() + offset, copied, out.begin());
    return Values{copied};
}

Result<Kernel::Values> Kernel::block_stat(Args const args)
{
    BOOST_OUTCOME_TRY(auto const *const block, blocks_.get(args[0]));
    return Values{block->size()};
}

Result<Kernel::Values> Kernel::block_link(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    BOOST_OUTCOME_TRY(auto const *const block, blocks_.get(args[0]));
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[1], sizeof(bytes32_t)));
    BOOST_OUTCOME_TRY(
        charge(machine.price_list().on_block_link(block->size())));
    write_bytes32(out, machine.blockstore().put(*block));
    return Values{};
}

Result<Kernel::Values>
Kernel::get_actor_code_hash(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[1], sizeof(bytes32_t)));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_actor_lookup()));
    BOOST_OUTCOME_TRY(
        auto const actor, machine.state_tree().get_actor(args[0]));
    if (!actor.has_value()) {
        return ErrorNumber::NotFound;
    }
    write_bytes32(out, actor->code_hash);
    return Values{};
}

Result<Kernel::Values>
Kernel::create_actor(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    auto &state = machine.state_tree();
    ActorID const id = args[0];

    BOOST_OUTCOME_TRY(auto const code_hash, read_bytes32(memory, args[1]));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_create_actor()));
    // only ids handed out by NEXT_ACTOR_ID in this message, once each
    if (FVM_UNLIKELY(!state.is_unused_id(id))) {
        return ErrorNumber::IllegalArgument;
    }
    if (code_hash == NULL_HASH ||
        !machine.blockstore().get(code_hash).has_value()) {
        return ErrorNumber::NotFound;
    }
    BOOST_OUTCOME_TRY(
        state.create_actor(id, ActorState{.code_hash = code_hash}));
    return Values{};
}

Result<Kernel::Values> Kernel::send(Args const args, vm::Memory &memory)
{
    ActorID const to = args[0];
    MethodNum const method = args[1];
    BlockHandle const params_handle = args[2];

    BOOST_OUTCOME_TRY(auto const value, read_amount(memory, args[3]));
    byte_string_view params;
    if (params_handle != NO_BLOCK) {
        BOOST_OUTCOME_TRY(auto const *const block, blocks_.get(params_handle));
        params = *block;
    }

    BOOST_OUTCOME_TRY(
        auto result,
        call_manager_.send(receiver_, to, method, params, value));

    BlockHandle handle = NO_BLOCK;
    if (!result.return_data.empty()) {
        BOOST_OUTCOME_TRY(handle, blocks_.put(std::move(result.return_data)));
    }
    return Values{static_cast<uint64_t>(result.exit_code), handle};
}

Result<Kernel::Values>
Kernel::get_randomness(Syscall const id, Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    auto const tag = std::bit_cast<int64_t>(args[0]);
    auto const round = std::bit_cast<ChainEpoch>(args[1]);
    uint64_t const entropy_len = args[3];

    if (FVM_UNLIKELY(round < 0 || round > machine.config().epoch)) {
        return ErrorNumber::IllegalArgument;
    }
    BOOST_OUTCOME_TRY(
        auto const entropy, read_memory(memory, args[2], entropy_len));
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[4], sizeof(bytes32_t)));
    BOOST_OUTCOME_TRY(
        charge(machine.price_list().on_get_randomness(entropy_len)));

    auto &externs = machine.externs();
    BOOST_OUTCOME_TRY(
        auto const seed,
        id == Syscall::GET_CHAIN_RANDOMNESS
            ? externs.get_chain_randomness(round)
            : externs.get_beacon_randomness(round));

    byte_string input;
    append_be64(input, std::bit_cast<uint64_t>(tag));
    append_be64(input, std::bit_cast<uint64_t>(round));
    input.append(seed.bytes, sizeof(seed.bytes));
    input += entropy;
    write_bytes32(out, to_bytes(blake3(input)));
    return Values{};
}

Result<Kernel::Values> Kernel::hash(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    uint64_t const kind = args[0];

    BOOST_OUTCOME_TRY(auto const input, read_memory(memory, args[1], args[2]));
    BOOST_OUTCOME_TRY(
        auto const out, output_memory(memory, args[3], sizeof(bytes32_t)));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_hash(input.size())));

    bytes32_t digest;
    switch (kind) {
    case HASH_KECCAK256:
        digest = to_bytes(keccak256(input));
        break;
    case HASH_BLAKE3:
        digest = to_bytes(blake3(input));
        break;
    default: {
        BOOST_OUTCOME_TRY(digest, machine.crypto().hash(kind, input));
    }
    }
    write_bytes32(out, digest);
    return Values{};
}

Result<Kernel::Values> Kernel::verify(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    uint64_t const kind = args[0];

    if (FVM_UNLIKELY(kind >= NUM_VERIFY_KINDS)) {
        return ErrorNumber::IllegalArgument;
    }
    BOOST_OUTCOME_TRY(auto const input, read_memory(memory, args[1], args[2]));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_verify(
        static_cast<VerifyKind>(kind), input.size())));
    BOOST_OUTCOME_TRY(
        bool const valid, machine.crypto().verify(kind, input));
    return Values{valid ? 1u : 0u};
}

Result<Kernel::Values> Kernel::emit_event(Args const args, vm::Memory &memory)
{
    auto &machine = call_manager_.machine();
    uint64_t const len = args[1];
    if (FVM_UNLIKELY(len > machine.engine_config().max_block_size)) {
        return ErrorNumber::LimitExceeded;
    }
    BOOST_OUTCOME_TRY(auto const data, read_memory(memory, args[0], len));
    BOOST_OUTCOME_TRY(charge(machine.price_list().on_emit_event(len)));
    machine.state_tree().emit_event(
        ActorEvent{.emitter = receiver_, .data = byte_string{data}});
    return Values{};
}

Result<Kernel::Values> Kernel::log(Args const args, vm::Memory &memory)
{
    auto const &engine = call_manager_.machine().engine_config();
    uint64_t const len = args[1];
    if (FVM_UNLIKELY(len > engine.max_block_size)) {
        return ErrorNumber::LimitExceeded;
    }
    BOOST_OUTCOME_TRY(auto const message, read_memory(memory, args[0], len));
    LOG_DEBUG(
        "actor {}: {}",
        receiver_,
        std::string_view{
            reinterpret_cast<char const *>(message.data()), message.size()});
    return Values{};
}

FVM_NAMESPACE_END
