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

#include <fvm/core/blake3.hpp>
#include <fvm/core/byte_string.hpp>
#include <fvm/core/bytes.hpp>
#include <fvm/core/keccak.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/kernel/block_registry.hpp>
#include <fvm/execution/kernel/syscalls.hpp>
#include <fvm/execution/machine/machine_config.hpp>
#include <fvm/execution/receipt.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/types.hpp>
#include <fvm/test/machine_fixture.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>
#include <fvm/vm/utils/assembler.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <string_view>
#include <utility>

using namespace fvm;
using namespace fvm::test;
using namespace fvm::vm;
using fvm::vm::utils::Assembler;

namespace
{
    constexpr ActorID TARGET = 1000;
    constexpr MethodNum MAIN = 1;

    uint16_t id(Syscall const s)
    {
        return static_cast<uint16_t>(s);
    }

    Assembler program(byte_string data = {})
    {
        Assembler a;
        a.data(std::move(data)).export_method(MAIN, "main").label("main");
        return a;
    }

    // moves the top of the stack to memory at `addr`
    Assembler &store_at(Assembler &a, uint64_t const addr)
    {
        return a.push(addr).swap(1).ins(STORE64);
    }

    byte_string text(std::string_view const s)
    {
        return {reinterpret_cast<uint8_t const *>(s.data()), s.size()};
    }

    byte_string be256(TokenAmount const &value)
    {
        byte_string out(32, 0);
        intx::be::unsafe::store(out.data(), value);
        return out;
    }

    byte_string bytes_of(bytes32_t const &hash)
    {
        return {hash.bytes, sizeof(hash.bytes)};
    }

    uint64_t le64_at(byte_string const &out, size_t const offset)
    {
        uint64_t value = 0;
        for (size_t i = 0; i < 8; ++i) {
            value |= uint64_t{out.at(offset + i)} << (8 * i);
        }
        return value;
    }

    class KernelTest : public MachineTest
    {
    protected:
        ApplyRet call(
            Assembler const &code, MachineConfig const &config = {},
            TokenAmount const &value = 0, byte_string params = {})
        {
            add_actor(TARGET, code.build(), 1000);
            start(config);
            return apply(message(TARGET, MAIN, value, std::move(params)));
        }
    };
}

TEST_F(KernelTest, message_context)
{
    auto a = program();
    a.ins(POP);
    store_at(a.syscall(id(Syscall::CALLER)).ins(POP), 0);
    store_at(a.syscall(id(Syscall::RECEIVER)).ins(POP), 8);
    store_at(a.syscall(id(Syscall::METHOD_NUMBER)).ins(POP), 16);
    a.push(32).syscall(id(Syscall::VALUE_RECEIVED)).ins(POP).ret(0, 64);

    auto const ret = call(a, {}, 77);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(SENDER) + le64(TARGET) + le64(MAIN) + le64(0) + be256(77));
    EXPECT_EQ(balance(TARGET), 1077);
}

TEST_F(KernelTest, network_context)
{
    auto a = program();
    a.ins(POP);
    store_at(a.syscall(id(Syscall::EPOCH)).ins(POP), 0);
    store_at(a.syscall(id(Syscall::VERSION)).ins(POP), 8);
    store_at(a.syscall(id(Syscall::CHAIN_ID)).ins(POP), 16);
    a.push(32).syscall(id(Syscall::BASE_FEE)).ins(POP).ret(0, 64);

    auto const ret = call(a, {.epoch = 5, .base_fee = 250, .chain_id = 31415});
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(5) + le64(2) + le64(31415) + le64(0) + be256(250));
}

TEST_F(KernelTest, syscalls_follow_network_version)
{
    auto a = program();
    a.ins(POP);
    store_at(a.syscall(id(Syscall::VERSION)).ins(POP), 0);
    a.ret(0, 8);
    auto const ret = call(a, {.network_version = NetworkVersion::V1});
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(ret.receipt.return_data, le64(1));

    auto const v1 = syscall_table(NetworkVersion::V1);
    auto const v2 = syscall_table(NetworkVersion::V2);
    EXPECT_GT(v2.size(), v1.size());
    EXPECT_TRUE(syscall_table(static_cast<NetworkVersion>(9)).empty());
}

TEST_F(KernelTest, unknown_syscall_fails_to_link)
{
    auto a = program();
    a.ins(POP).syscall(id(Syscall::CHAIN_ID)).ret(0, 0);
    auto const ret = call(a, {.network_version = NetworkVersion::V1});
    EXPECT_EQ(ret.receipt.exit_code, ExitCode::SYS_ILLEGAL_INSTRUCTION);
}

TEST_F(KernelTest, blocks_and_root)
{
    auto a = program(text("hello"));
    a.ins(POP);
    // create, link and install as the new root
    a.push(0).push(5).syscall(id(Syscall::BLOCK_CREATE)).ins(POP);
    a.dup(0).push(64).syscall(id(Syscall::BLOCK_LINK)).ins(POP);
    a.push(64).syscall(id(Syscall::SET_ROOT)).ins(POP);
    a.ins(POP);
    // read it back through the root
    a.push(128).syscall(id(Syscall::ROOT)).ins(POP);
    a.push(128).syscall(id(Syscall::BLOCK_OPEN)).ins(POP);
    store_at(a, 200);
    store_at(a.dup(0).syscall(id(Syscall::BLOCK_STAT)).ins(POP), 208);
    a.push(1).push(300).push(100).syscall(id(Syscall::BLOCK_READ)).ins(POP);
    store_at(a, 216);
    // unknown handle
    a.push(12345).syscall(id(Syscall::BLOCK_STAT));
    store_at(a, 224);
    a.ins(POP).ret(128, 180);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    auto const &out = ret.receipt.return_data;
    ASSERT_EQ(out.size(), 180);

    auto const hello = to_bytes(keccak256(text("hello")));
    EXPECT_EQ(out.substr(0, 32), bytes_of(hello));
    EXPECT_EQ(le64_at(out, 72), 5);
    EXPECT_EQ(le64_at(out, 80), 5);
    EXPECT_EQ(le64_at(out, 88), 4);
    EXPECT_EQ(
        le64_at(out, 96), static_cast<uint64_t>(ErrorNumber::InvalidHandle));
    EXPECT_EQ(out.substr(172, 4), text("ello"));

    EXPECT_EQ(actor(TARGET)->state_root, hello);
    EXPECT_EQ(store.get(hello), text("hello"));
}

TEST_F(KernelTest, set_root_requires_stored_block)
{
    auto a = program();
    a.ins(POP);
    store_at(a.push(0).syscall(id(Syscall::SET_ROOT)), 64);
    a.ret(64, 8);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(static_cast<uint64_t>(ErrorNumber::NotFound)));
    EXPECT_EQ(actor(TARGET)->state_root, NULL_HASH);
}

TEST_F(KernelTest, block_open_of_missing_block)
{
    auto a = program();
    a.ins(POP).push(0).syscall(id(Syscall::BLOCK_OPEN));
    store_at(a, 64);
    a.ret(64, 8);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(static_cast<uint64_t>(ErrorNumber::NotFound)));
}

TEST_F(KernelTest, missing_own_state_is_fatal)
{
    using namespace evmc::literals;
    auto a = program();
    a.ins(POP).push(0).syscall(id(Syscall::ROOT)).ins(POP);
    a.push(0).syscall(id(Syscall::BLOCK_OPEN)).ret(0, 0);

    add_genesis_actor(
        TARGET,
        ActorState{
            .code_hash = store.put(a.build()),
            .state_root =
                0x5555555555555555555555555555555555555555555555555555555555555555_bytes32});
    start();

    auto const result = machine->new_executor().apply(message(TARGET, MAIN));
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), ExecutionError::MissingBlock);
}

TEST_F(KernelTest, params_block)
{
    auto a = program();
    store_at(a, 8);
    a.push(1).push(0).push(16).push(100).syscall(id(Syscall::BLOCK_READ));
    store_at(a, 0);
    a.ins(POP).ret(0, 19);

    auto const ret = call(a, {}, 0, text("xyz"));
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(ret.receipt.return_data, le64(0) + le64(1) + text("xyz"));
}

TEST_F(KernelTest, no_params_block)
{
    auto a = program();
    store_at(a, 8);
    a.push(1).push(0).push(16).push(100).syscall(id(Syscall::BLOCK_READ));
    store_at(a, 0);
    a.ins(POP).ret(0, 16);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(static_cast<uint64_t>(ErrorNumber::InvalidHandle)) + le64(0));
}

TEST_F(KernelTest, hash)
{
    auto a = program(text("abc"));
    a.ins(POP);
    a.push(HASH_KECCAK256).push(0).push(3).push(32);
    a.syscall(id(Syscall::HASH)).ins(POP);
    a.push(HASH_BLAKE3).push(0).push(3).push(64);
    a.syscall(id(Syscall::HASH)).ins(POP);
    a.push(FakeCryptoOracle::DOUBLE_KECCAK).push(0).push(3).push(96);
    a.syscall(id(Syscall::HASH)).ins(POP);
    a.push(7).push(0).push(3).push(128).syscall(id(Syscall::HASH));
    store_at(a, 160);
    a.ret(32, 136);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);

    auto const abc = text("abc");
    auto const once = to_bytes(keccak256(abc));
    EXPECT_EQ(
        ret.receipt.return_data,
        bytes_of(once) + bytes_of(to_bytes(blake3(abc))) +
            bytes_of(to_bytes(keccak256(bytes_of(once)))) +
            byte_string(32, 0) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)));
}

TEST_F(KernelTest, verify)
{
    auto a = program(byte_string{0x01, 0x00});
    a.ins(POP);
    a.push(0).push(0).push(1).syscall(id(Syscall::VERIFY));
    store_at(a, 108);
    store_at(a, 100);
    a.push(1).push(1).push(1).syscall(id(Syscall::VERIFY));
    store_at(a, 124);
    store_at(a, 116);
    a.push(5).push(0).push(1).syscall(id(Syscall::VERIFY));
    store_at(a, 140);
    store_at(a, 132);
    a.ret(100, 48);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(1) + le64(0) + le64(0) + le64(0) + le64(0) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)));
}

TEST_F(KernelTest, randomness)
{
    auto a = program(text("seed"));
    a.ins(POP);
    a.push(7).push(3).push(0).push(4).push(32);
    a.syscall(id(Syscall::GET_CHAIN_RANDOMNESS)).ins(POP);
    a.push(7).push(3).push(0).push(4).push(64);
    a.syscall(id(Syscall::GET_BEACON_RANDOMNESS)).ins(POP);
    // a round after the current epoch
    a.push(7).push(11).push(0).push(4).push(96);
    a.syscall(id(Syscall::GET_CHAIN_RANDOMNESS));
    store_at(a, 128);
    a.ret(32, 104);

    auto const ret = call(a, {.epoch = 10});
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);

    auto const expected = [](bytes32_t const &seed) {
        byte_string input;
        input += byte_string{0, 0, 0, 0, 0, 0, 0, 7};
        input += byte_string{0, 0, 0, 0, 0, 0, 0, 3};
        input += bytes_of(seed);
        input += text("seed");
        return bytes_of(to_bytes(blake3(input)));
    };
    auto const chain = expected(externs.get_chain_randomness(3).value());
    auto const beacon = expected(externs.get_beacon_randomness(3).value());
    EXPECT_NE(chain, beacon);
    EXPECT_EQ(
        ret.receipt.return_data,
        chain + beacon + byte_string(32, 0) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)));
}

TEST_F(KernelTest, create_actor)
{
    auto const child = Assembler{}
                           .export_method(MAIN, "main")
                           .label("main")
                           .ins(POP)
                           .abort(33)
                           .build();
    auto const child_hash = store.put(child);

    auto a = program(bytes_of(child_hash));
    a.ins(POP);
    a.syscall(id(Syscall::NEXT_ACTOR_ID)).ins(POP);
    store_at(a.dup(0).push(0).syscall(id(Syscall::CREATE_ACTOR)), 64);
    store_at(a.dup(0).push(0).syscall(id(Syscall::CREATE_ACTOR)), 72);
    a.dup(0).push(96).syscall(id(Syscall::GET_ACTOR_CODE_HASH)).ins(POP);
    store_at(a, 80);
    store_at(a.push(50).push(0).syscall(id(Syscall::CREATE_ACTOR)), 88);
    a.ret(64, 64);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    constexpr ActorID created = TARGET + 1;
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(0) + le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)) +
            le64(created) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)) +
            bytes_of(child_hash));

    auto const state = actor(created);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->code_hash, child_hash);
    EXPECT_EQ(state->balance, 0);
    EXPECT_EQ(machine->state_tree().next_actor_id(), created + 1);

    EXPECT_EQ(
        apply(message(created, MAIN)).receipt.exit_code,
        static_cast<ExitCode>(33));
}

TEST_F(KernelTest, create_actor_needs_a_fresh_id)
{
    constexpr ActorID DESTROYED = 150;
    constexpr ActorID GAP = 500;
    add_actor(
        DESTROYED,
        Assembler{}
            .export_method(MAIN, "main")
            .label("main")
            .ins(POP)
            .push(BURNT_FUNDS_ACTOR_ID)
            .syscall(id(Syscall::SELF_DESTRUCT))
            .ins(POP)
            .ret(0, 0)
            .build());
    auto const child_hash = store.put(Assembler{}
                                          .export_method(MAIN, "main")
                                          .label("main")
                                          .ins(POP)
                                          .ret(0, 0)
                                          .build());

    // zero at 256 is the value sent
    auto a = program(bytes_of(child_hash));
    a.ins(POP);
    a.push(DESTROYED).push(MAIN).push(NO_BLOCK).push(256);
    a.syscall(id(Syscall::SEND)).ins(POP).ins(POP);
    store_at(a, 64);
    store_at(a.push(DESTROYED).push(0).syscall(id(Syscall::CREATE_ACTOR)), 72);
    store_at(a.push(GAP).push(0).syscall(id(Syscall::CREATE_ACTOR)), 80);
    a.ret(64, 24);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(0) + le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)));
    EXPECT_EQ(actor(DESTROYED), std::nullopt);
    EXPECT_EQ(actor(GAP), std::nullopt);
}

TEST_F(KernelTest, code_hash_of_missing_actor)
{
    auto a = program();
    a.ins(POP).push(9999).push(0).syscall(id(Syscall::GET_ACTOR_CODE_HASH));
    store_at(a, 64);
    a.ret(64, 8);

    auto const ret = call(a);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(static_cast<uint64_t>(ErrorNumber::NotFound)));
}

TEST_F(KernelTest, self_destruct)
{
    constexpr ActorID HEIR = 200;
    add_account(HEIR, 5);

    auto a = program();
    a.ins(POP);
    store_at(a.push(9999).syscall(id(Syscall::SELF_DESTRUCT)), 0);
    store_at(a.push(TARGET).syscall(id(Syscall::SELF_DESTRUCT)), 8);
    store_at(a.push(HEIR).syscall(id(Syscall::SELF_DESTRUCT)), 16);
    store_at(a.push(64).syscall(id(Syscall::CURRENT_BALANCE)), 24);
    a.ret(0, 32);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(static_cast<uint64_t>(ErrorNumber::NotFound)) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)) +
            le64(0) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalOperation)));
    EXPECT_EQ(actor(TARGET), std::nullopt);
    EXPECT_EQ(balance(HEIR), 1005);
    EXPECT_EQ(balance(BURNT_FUNDS_ACTOR_ID), 0);
}

TEST_F(KernelTest, self_destruct_burning_funds)
{
    auto a = program();
    a.ins(POP).push(BURNT_FUNDS_ACTOR_ID).syscall(
        id(Syscall::SELF_DESTRUCT));
    store_at(a, 0);
    a.ret(0, 8);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(ret.receipt.return_data, le64(0));
    EXPECT_EQ(actor(TARGET), std::nullopt);
    EXPECT_EQ(balance(BURNT_FUNDS_ACTOR_ID), 1000);
}

TEST_F(KernelTest, self_destruct_reverts_with_the_frame)
{
    constexpr ActorID HEIR = 200;
    add_account(HEIR, 5);

    auto a = program();
    a.ins(POP).push(HEIR).syscall(id(Syscall::SELF_DESTRUCT)).ins(POP);
    a.abort(33);

    auto const ret = call(a);
    EXPECT_EQ(ret.receipt.exit_code, static_cast<ExitCode>(33));
    auto const state = actor(TARGET);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(state->balance, 1000);
    EXPECT_EQ(balance(HEIR), 5);
}

TEST_F(KernelTest, gas_syscalls)
{
    auto a = program();
    a.ins(POP);
    a.syscall(id(Syscall::AVAILABLE)).ins(POP);
    a.push(1000).syscall(id(Syscall::CHARGE_GAS)).ins(POP);
    a.syscall(id(Syscall::AVAILABLE)).ins(POP);
    a.ins(SUB);
    store_at(a, 0);
    a.ret(0, 8);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    // the block is charged on entry, so only syscalls fall in between
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(1000 + 2 * machine->price_list().syscall));
}

TEST_F(KernelTest, events_and_log)
{
    auto a = program(text("evt"));
    a.ins(POP);
    a.push(0).push(3).syscall(id(Syscall::EMIT_EVENT)).ins(POP);
    store_at(a.push(0).push(3).syscall(id(Syscall::LOG)), 8);
    store_at(
        a.push(0).push(2 << 20).syscall(id(Syscall::EMIT_EVENT)), 16);
    store_at(
        a.push(PAGE_SIZE).push(8).syscall(id(Syscall::EMIT_EVENT)), 24);
    a.ret(8, 24);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(
        ret.receipt.return_data,
        le64(0) + le64(static_cast<uint64_t>(ErrorNumber::LimitExceeded)) +
            le64(static_cast<uint64_t>(ErrorNumber::IllegalArgument)));
    ASSERT_EQ(ret.events.size(), 1);
    EXPECT_EQ(ret.events[0].emitter, TARGET);
    EXPECT_EQ(ret.events[0].data, text("evt"));
}

TEST_F(KernelTest, nested_send_returns_data)
{
    constexpr ActorID CALLEE = 2000;
    add_actor(
        CALLEE,
        Assembler{}
            .data(text("pong"))
            .export_method(MAIN, "main")
            .label("main")
            .ins(POP)
            .ret(0, 4)
            .build());

    auto a = program();
    a.ins(POP);
    a.push(CALLEE).push(MAIN).push(0).push(128);
    a.syscall(id(Syscall::SEND)).ins(POP);
    // [exit code, handle]
    a.push(0).push(16).push(100).syscall(id(Syscall::BLOCK_READ));
    a.ins(POP).ins(POP);
    store_at(a, 8);
    a.ret(8, 12);

    auto const ret = call(a);
    ASSERT_EQ(ret.receipt.exit_code, ExitCode::OK);
    EXPECT_EQ(ret.receipt.return_data, le64(0) + text("pong"));
}
