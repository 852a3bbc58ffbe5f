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
#include <fvm/core/result.hpp>
#include <fvm/execution/message.hpp>
#include <fvm/execution/receipt.hpp>

#include <cstdint>
#include <utility>

FVM_NAMESPACE_BEGIN

class Machine;

/// Split of unused gas between refund and burn: {refund, burn}. Usage
/// within 10% of the limit burns nothing.
std::pair<uint64_t, uint64_t>
compute_gas_overestimation_burn(uint64_t gas_used, uint64_t gas_limit);

class Executor
{
    Machine &machine_;

public:
    explicit Executor(Machine &);

    /// Produces exactly one receipt per message, with the state tree
    /// flushed. An error means no receipt exists and no state changed.
    Result<ApplyRet> apply(Message const &);
};

FVM_NAMESPACE_END
