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
#include <fvm/execution/gas/gas_charge.hpp>

#include <cstdint>

FVM_NAMESPACE_BEGIN

/// The single gas pool of one message, shared by every frame.
class GasTracker
{
    uint64_t limit_;
    uint64_t used_;

public:
    explicit GasTracker(uint64_t limit, uint64_t used = 0);

    /// On failure nothing may be performed for the charge, and the pool is
    /// exhausted: used becomes the limit.
    Result<void> charge(GasCharge const &);

    uint64_t limit() const noexcept
    {
        return limit_;
    }

    uint64_t used() const noexcept
    {
        return used_;
    }

    uint64_t available() const noexcept
    {
        return limit_ - used_;
    }
};

FVM_NAMESPACE_END
