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

#include <fvm/execution/gas/price_list.hpp>
#include <fvm/execution/types.hpp>

#include <gtest/gtest.h>

#include <initializer_list>

using namespace fvm;

TEST(PriceList, known_versions)
{
    auto const *const v1 = price_list_by_version(NetworkVersion::V1);
    auto const *const v2 = price_list_by_version(NetworkVersion::V2);
    ASSERT_NE(v1, nullptr);
    ASSERT_NE(v2, nullptr);
    EXPECT_NE(v1, v2);
    EXPECT_EQ(price_list_by_version(static_cast<NetworkVersion>(99)), nullptr);
}

TEST(PriceList, storage_writes_repriced)
{
    auto const &v1 = *price_list_by_version(NetworkVersion::V1);
    auto const &v2 = *price_list_by_version(NetworkVersion::V2);

    EXPECT_GT(v2.on_block_link(100).amount, v1.on_block_link(100).amount);
    EXPECT_GT(v2.on_set_root().amount, v1.on_set_root().amount);
    EXPECT_GT(v2.on_memory_grow(1).amount, v1.on_memory_grow(1).amount);
    EXPECT_EQ(v1.on_hash(64).amount, v2.on_hash(64).amount);
}

TEST(PriceList, charges_scale_with_size)
{
    auto const &prices = *price_list_by_version(NetworkVersion::V2);

    EXPECT_EQ(
        prices.on_chain_message(10).amount,
        prices.chain_message.flat + 10 * prices.chain_message.per_byte);
    EXPECT_LT(prices.on_block_read(1).amount, prices.on_block_read(2).amount);
    EXPECT_EQ(
        prices.on_memory_grow(3).amount, 3 * prices.on_memory_grow(1).amount);
    EXPECT_EQ(prices.on_memory_grow(1).amount, prices.memory_page);
    EXPECT_EQ(prices.on_memory_grow(0).amount, 0);
}

TEST(PriceList, method_invocation)
{
    auto const &prices = *price_list_by_version(NetworkVersion::V2);

    auto const plain = prices.on_method_invocation(0, METHOD_SEND);
    EXPECT_EQ(plain.amount, prices.send_base);
    EXPECT_EQ(plain.name, "send_transfer");

    auto const funded = prices.on_method_invocation(5, 2);
    EXPECT_EQ(funded.amount, prices.send_base + prices.send_transfer_funds);
    EXPECT_EQ(funded.name, "send_invoke");
}

TEST(PriceList, verify_by_kind)
{
    auto const &prices = *price_list_by_version(NetworkVersion::V1);
    EXPECT_LT(
        prices.on_verify(VerifyKind::Signature, 32).amount,
        prices.on_verify(VerifyKind::Proof, 32).amount);
}

TEST(PriceList, transfers_cost_extra_in_every_version)
{
    for (auto const version : {NetworkVersion::V1, NetworkVersion::V2}) {
        auto const &prices = *price_list_by_version(version);
        EXPECT_EQ(prices.send_transfer_funds, 50);
        EXPECT_EQ(
            prices.on_method_invocation(1, 2).amount -
                prices.on_method_invocation(0, 2).amount,
            50);
    }
    EXPECT_EQ(price_list_by_version(NetworkVersion::V1)->send_base, 100);
    EXPECT_EQ(price_list_by_version(NetworkVersion::V2)->send_base, 120);
}
