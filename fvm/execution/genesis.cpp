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

#include <fvm/core/byte_string.hpp>
#include <fvm/core/bytes.hpp>
#include <fvm/core/int.hpp>
#include <fvm/core/result.hpp>
#include <fvm/execution/genesis.hpp>
#include <fvm/execution/state/actor_state.hpp>
#include <fvm/execution/state/blockstore.hpp>
#include <fvm/execution/state/state_tree.hpp>
#include <fvm/execution/types.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <boost/outcome/try.hpp>

#include <evmc/hex.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

FVM_ANONYMOUS_NAMESPACE_BEGIN

Result<ActorID> parse_actor_id(std::string const &key)
{
    ActorID id{};
    auto const *const end = key.data() + key.size();
    auto const [ptr, ec] = std::from_chars(key.data(), end, id);
    if (key.empty() || ec != std::errc{} || ptr != end) {
        return GenesisError::InvalidActorId;
    }
    return id;
}

Result<TokenAmount> parse_balance(nlohmann::json const &value)
{
    if (!value.is_string()) {
        return GenesisError::InvalidBalance;
    }
    try {
        return intx::from_string<uint256_t>(value.get<std::string>());
    }
    catch (std::invalid_argument const &) {
        return GenesisError::InvalidBalance;
    }
    catch (std::out_of_range const &) {
        return GenesisError::InvalidBalance;
    }
}

FVM_ANONYMOUS_NAMESPACE_END

FVM_NAMESPACE_BEGIN

Result<bytes32_t>
load_genesis_state(std::string_view const document, Blockstore &store)
{
    auto const doc = nlohmann::json::parse(document, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return GenesisError::InvalidDocument;
    }

    auto state = StateTree::empty(store);
    for (auto const &item : doc.items()) {
        auto const &alloc = item.value();
        if (!alloc.is_object()) {
            return GenesisError::InvalidDocument;
        }
        BOOST_OUTCOME_TRY(auto const id, parse_actor_id(item.key()));

        ActorState actor;
        if (alloc.contains("balance")) {
            BOOST_OUTCOME_TRY(actor.balance, parse_balance(alloc["balance"]));
        }
        if (alloc.contains("sequence")) {
            auto const &sequence = alloc["sequence"];
            if (!sequence.is_number_unsigned()) {
                return GenesisError::InvalidSequence;
            }
            actor.sequence = sequence.get<uint64_t>();
        }
        if (alloc.contains("code")) {
            auto const &code = alloc["code"];
            if (!code.is_string()) {
                return GenesisError::InvalidCode;
            }
            auto const bytes = evmc::from_hex(code.get<std::string>());
            if (!bytes.has_value() || bytes->empty()) {
                return GenesisError::InvalidCode;
            }
            actor.code_hash = store.put(*bytes);
        }

        state.set_actor(id, actor);
        if (id >= FIRST_NON_SINGLETON_ADDR) {
            state.reserve_ids_below(id + 1);
        }
    }
    return state.flush();
}

FVM_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<fvm::GenesisError>::mapping> const &
quick_status_code_from_enum<fvm::GenesisError>::value_mappings()
{
    using fvm::GenesisError;

    static std::initializer_list<mapping> const v = {
        {GenesisError::Success, "success", {errc::success}},
        {GenesisError::InvalidDocument, "invalid genesis document", {}},
        {GenesisError::InvalidActorId, "invalid actor id", {}},
        {GenesisError::InvalidBalance, "invalid balance", {}},
        {GenesisError::InvalidSequence, "invalid sequence", {}},
        {GenesisError::InvalidCode, "invalid code", {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
