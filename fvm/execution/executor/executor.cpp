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
#include <fvm/core/int.hpp>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/execution/call_manager/call_manager.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/exit_code.hpp>
#include <fvm/execution/executor/executor.hpp>
#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/machine/machine.hpp>
#include <fvm/execution/message.hpp>
#include <fvm/execution/receipt.hpp>
#include <fvm/execution/rlp/event_rlp.hpp>
#include <fvm/execution/rlp/message_rlp.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

FVM_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t GAS_OVERUSE_NUM = 11;
constexpr uint64_t GAS_OVERUSE_DENOM = 10;

Result<void>
credit(StateTree &state, ActorID const id, TokenAmount const &amount)
{
    if (amount == 0) {
        return outcome::success();
    }
    BOOST_OUTCOME_TRY(auto actor, state.get_actor(id));
    if (FVM_UNLIKELY(!actor.has_value())) {
        return ExecutionError::MissingActor;
    }
    actor->balance += amount;
    state.set_actor(id, *actor);
    return outcome::success();
}

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

std::pair<uint64_t, uint64_t> compute_gas_overestimation_burn(
    uint64_t const gas_used, uint64_t const gas_limit)
{
    FVM_ASSERT(gas_used <= gas_limit);

    if (gas_used == 0) {
        return {0, gas_limit};
    }

    uint128_t const allowed =
        uint128_t{gas_used} * GAS_OVERUSE_NUM / GAS_OVERUSE_DENOM;
    if (uint128_t{gas_limit} <= allowed) {
        return {gas_limit - gas_used, 0};
    }
    uint64_t const over =
        std::min(gas_limit - static_cast<uint64_t>(allowed), gas_used);

    uint64_t const unused = gas_limit - gas_used;
    auto const burn = static_cast<uint64_t>(
        uint128_t{unused} * over / gas_used);
    return {unused - burn, burn};
}

Executor::Executor(Machine &machine)
    : machine_{machine}
{
}

Result<ApplyRet> Executor::apply(Message const &msg)
{
    auto &state = machine_.state_tree();
    auto const &config = machine_.config();
    auto const &prices = machine_.price_list();

    FVM_ASSERT(state.version() == 0);
    state.clear_events();

    uint64_t const inclusion =
        prices.on_chain_message(rlp::encode_message(msg).size()).amount;

    auto const reject = [&](ExitCode const code) {
        ApplyRet ret;
        ret.receipt.exit_code = code;
        ret.receipt.events_root = events_root({});
        ret.penalty = config.base_fee * inclusion;
        return ret;
    };

    if (msg.gas_limit < inclusion) {
        return reject(ExitCode::SYS_OUT_OF_GAS);
    }
    if (msg.gas_limit > config.block_gas_limit) {
        return reject(ExitCode::SYS_ASSERTION_FAILED);
    }

    BOOST_OUTCOME_TRY(auto sender, state.get_actor(msg.from));
    if (!sender.has_value() || sender->has_code()) {
        return reject(ExitCode::SYS_SENDER_INVALID);
    }
    if (sender->sequence != msg.sequence) {
        return reject(ExitCode::SYS_SENDER_STATE_INVALID);
    }

    TokenAmount const gas_cost = msg.gas_fee_cap * msg.gas_limit;
    TokenAmount const required = gas_cost + msg.value;
    bool const overflow =
        (msg.gas_fee_cap != 0 && gas_cost / msg.gas_fee_cap != msg.gas_limit) ||
        required < gas_cost;
    if (overflow || sender->balance < required) {
        return reject(ExitCode::SYS_SENDER_STATE_INVALID);
    }

    state.push();

    auto result = [&]() -> Result<ApplyRet> {
        sender->sequence += 1;
        sender->balance -= gas_cost;
        state.set_actor(msg.from, *sender);

        CallManager call_manager{machine_, msg.gas_limit};
        BOOST_OUTCOME_TRY(
            call_manager.gas().charge({"on_chain_message", inclusion}));
        BOOST_OUTCOME_TRY(
            auto invocation,
            call_manager.send(
                msg.from, msg.to, msg.method, msg.params, msg.value));

        uint64_t const gas_used = call_manager.gas().used();
        auto const [gas_refund, gas_burned] =
            compute_gas_overestimation_burn(gas_used, msg.gas_limit);

        TokenAmount const base_fee_to_pay =
            std::min(config.base_fee, msg.gas_fee_cap);
        TokenAmount const premium =
            std::min(msg.gas_premium, msg.gas_fee_cap - base_fee_to_pay);

        ApplyRet ret;
        ret.receipt = Receipt{
            .exit_code = invocation.exit_code,
            .return_data = std::move(invocation.return_data),
            .gas_used = gas_used,
            .events_root = events_root(state.events())};
        ret.gas_refund = gas_refund;
        ret.gas_burned = gas_burned;
        ret.base_fee_burn = base_fee_to_pay * gas_used;
        ret.over_estimation_burn = base_fee_to_pay * gas_burned;
        ret.miner_tip = premium * msg.gas_limit;
        ret.refund = gas_cost - ret.base_fee_burn -
                     ret.over_estimation_burn - ret.miner_tip;
        if (config.base_fee > msg.gas_fee_cap) {
            ret.penalty = (config.base_fee - msg.gas_fee_cap) * gas_used;
        }
        ret.events = state.events();

        BOOST_OUTCOME_TRY(credit(
            state,
            BURNT_FUNDS_ACTOR_ID,
            ret.base_fee_burn + ret.over_estimation_burn));
        BOOST_OUTCOME_TRY(credit(state, REWARD_ACTOR_ID, ret.miner_tip));
        BOOST_OUTCOME_TRY(credit(state, msg.from, ret.refund));
        return ret;
    }();

    if (FVM_UNLIKELY(result.has_error())) {
        state.pop_reject();
        state.clear_events();
        LOG_ERROR(
            "message from {} to {} failed: {}",
            msg.from,
            msg.to,
            std::string{result.assume_error().message().c_str()});
        return result;
    }

    state.pop_accept();
    BOOST_OUTCOME_TRY(state.flush());
    return result;
}

FVM_NAMESPACE_END
