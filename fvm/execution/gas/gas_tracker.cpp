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
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/execution/error.hpp>
#include <fvm/execution/gas/gas_charge.hpp>
#include <fvm/execution/gas/gas_tracker.hpp>

#include <boost/outcome/success_failure.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

using BOOST_OUTCOME_V2_NAMESPACE::success;

GasTracker::GasTracker(uint64_t const limit, uint64_t const used)
    : limit_{limit}
    , used_{used}
{
    FVM_ASSERT(used_ <= limit_);
}

Result<void> GasTracker::charge(GasCharge const &charge)
{
    if (FVM_UNLIKELY(charge.amount > limit_ - used_)) {
        used_ = limit_;
        return ExecutionError::OutOfGas;
    }
    used_ += charge.amount;
    return success();
}

FVM_NAMESPACE_END
