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
#include <fvm/core/unaligned.hpp>
#include <fvm/vm/host.hpp>
#include <fvm/vm/memory.hpp>
#include <fvm/vm/module.hpp>
#include <fvm/vm/opcodes.hpp>
#include <fvm/vm/sandbox.hpp>
#include <fvm/vm/status.hpp>

#include <algorithm>
#include <cstdint>
#include <span>
#include <utility>

namespace fvm::vm
{
    namespace
    {
        uint32_t
        memory_bound(Module const &module, SandboxLimits const &limits)
        {
            return std::max(
                module.min_pages(),
                std::min(module.max_pages(), limits.max_memory_pages));
        }
    }

    Sandbox::Sandbox(
        SharedModule module, SandboxLimits const &limits, MeteringHook meter,
        Host &host)
        : module_{std::move(module)}
        , memory_{module_->min_pages(), memory_bound(*module_, limits)}
        , max_stack_depth_{limits.max_stack_depth}
        , meter_{std::move(meter)}
        , host_{host}
    {
        auto const data = module_->data();
        FVM_ASSERT(data.size() <= memory_.size());
        std::copy(
            data.begin(), data.end(), memory_.span(0, data.size()).begin());
        stack_.reserve(max_stack_depth_);
    }

    bool Sandbox::push(uint64_t const value) noexcept
    {
        if (FVM_UNLIKELY(stack_.size() >= max_stack_depth_)) {
            return false;
        }
        stack_.push_back(value);
        return true;
    }

    ExecResult
    Sandbox::run(uint32_t const entry, std::span<uint64_t const> const args)
    {
        stack_.clear();
        for (auto const arg : args) {
            if (FVM_UNLIKELY(!push(arg))) {
                return {.status = StatusCode::StackOverflow};
            }
        }

        uint8_t const *const code = module_->code();
        size_t const code_size = module_->code_size();
        size_t pc = entry;

        auto const pop = [this] {
            uint64_t const v = stack_.back();
            stack_.pop_back();
            return v;
        };

        while (pc < code_size) {
            if (module_->is_block_start(pc)) {
                if (FVM_UNLIKELY(!meter_(module_->block_cost(pc)))) {
                    return {.status = StatusCode::OutOfGas};
                }
            }

            uint8_t const op = code[pc];
            auto const &info = opcode_table[op];
            if (FVM_UNLIKELY(stack_.size() < info.min_stack)) {
                return {.status = StatusCode::StackUnderflow};
            }
            uint8_t const *const imm = code + pc + 1;
            size_t next = pc + 1 + info.immediate_size;

            switch (op) {
            case NOP:
                break;
            case PUSH1:
                if (FVM_UNLIKELY(!push(imm[0]))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            case PUSH4:
                if (FVM_UNLIKELY(!push(unaligned_load<uint32_t>(imm)))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            case PUSH8:
                if (FVM_UNLIKELY(!push(unaligned_load<uint64_t>(imm)))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            case POP:
                stack_.pop_back();
                break;
            case DUP: {
                size_t const n = imm[0];
                if (FVM_UNLIKELY(stack_.size() <= n)) {
                    return {.status = StatusCode::StackUnderflow};
                }
                if (FVM_UNLIKELY(!push(stack_[stack_.size() - 1 - n]))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            }
            case SWAP: {
                size_t const n = imm[0];
                if (FVM_UNLIKELY(n == 0 || stack_.size() <= n)) {
                    return {.status = StatusCode::StackUnderflow};
                }
                std::swap(stack_.back(), stack_[stack_.size() - 1 - n]);
                break;
            }
            case ADD:
            case SUB:
            case MUL:
            case DIVU:
            case REMU:
            case AND:
            case OR:
            case XOR:
            case SHL:
            case SHR:
            case EQ:
            case LTU:
            case GTU: {
                uint64_t const b = pop();
                uint64_t const a = pop();
                uint64_t r = 0;
                switch (op) {
                case ADD:
                    r = a + b;
                    break;
                case SUB:
                    r = a - b;
                    break;
                case MUL:
                    r = a * b;
                    break;
                case DIVU:
                    if (FVM_UNLIKELY(b == 0)) {
                        return {.status = StatusCode::DivisionByZero};
                    }
                    r = a / b;
                    break;
                case REMU:
                    if (FVM_UNLIKELY(b == 0)) {
                        return {.status = StatusCode::DivisionByZero};
                    }
                    r = a % b;
                    break;
                case AND:
                    r = a & b;
                    break;
                case OR:
                    r = a | b;
                    break;
                case XOR:
                    r = a ^ b;
                    break;
                case SHL:
                    r = a << (b & 63);
                    break;
                case SHR:
                    r = a >> (b & 63);
                    break;
                case EQ:
                    r = a == b;
                    break;
                case LTU:
                    r = a < b;
                    break;
                case GTU:
                    r = a > b;
                    break;
                default:
                    std::unreachable();
                }
                stack_.push_back(r);
                break;
            }
            case ISZERO:
                stack_.back() = stack_.back() == 0;
                break;
            case NOT:
                stack_.back() = ~stack_.back();
                break;
            case JUMP:
                next = unaligned_load<uint32_t>(imm);
                break;
            case JUMPI:
                if (pop() != 0) {
                    next = unaligned_load<uint32_t>(imm);
                }
                break;
            case LOAD8:
            case LOAD64: {
                uint64_t const len = op == LOAD8 ? 1 : 8;
                uint64_t const addr = stack_.back();
                if (FVM_UNLIKELY(!memory_.in_bounds(addr, len))) {
                    return {.status = StatusCode::MemoryOutOfBounds};
                }
                auto const bytes = memory_.span(addr, len);
                stack_.back() = op == LOAD8
                                    ? bytes[0]
                                    : unaligned_load<uint64_t>(bytes.data());
                break;
            }
            case STORE8:
            case STORE64: {
                uint64_t const value = pop();
                uint64_t const addr = pop();
                uint64_t const len = op == STORE8 ? 1 : 8;
                if (FVM_UNLIKELY(!memory_.in_bounds(addr, len))) {
                    return {.status = StatusCode::MemoryOutOfBounds};
                }
                auto bytes = memory_.span(addr, len);
                if (op == STORE8) {
                    bytes[0] = static_cast<uint8_t>(value);
                }
                else {
                    unaligned_store(bytes.data(), value);
                }
                break;
            }
            case MSIZE:
                if (FVM_UNLIKELY(!push(memory_.size()))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            case MGROW: {
                uint64_t const delta = stack_.back();
                uint32_t const old_pages = memory_.pages();
                if (FVM_UNLIKELY(delta > memory_.max_pages() - old_pages)) {
                    return {.status = StatusCode::MemoryLimitExceeded};
                }
                switch (host_.grow_memory(static_cast<uint32_t>(delta))) {
                case MemoryGrant::Granted:
                    break;
                case MemoryGrant::OutOfGas:
                    return {.status = StatusCode::OutOfGas};
                case MemoryGrant::LimitExceeded:
                    return {.status = StatusCode::MemoryLimitExceeded};
                }
                bool const grown =
                    memory_.grow(static_cast<uint32_t>(delta));
                FVM_ASSERT(grown);
                stack_.back() = old_pages;
                break;
            }
            case SYSCALL: {
                auto const id = unaligned_load<uint16_t>(imm);
                auto const *const sig = module_->syscall(id);
                FVM_ASSERT(sig != nullptr);
                if (FVM_UNLIKELY(stack_.size() < sig->num_args)) {
                    return {.status = StatusCode::StackUnderflow};
                }
                std::span<uint64_t const> const args{
                    stack_.data() + stack_.size() - sig->num_args,
                    sig->num_args};
                auto const result = host_.syscall(*sig, args, memory_);
                switch (result.status) {
                case SyscallStatus::Continue:
                    break;
                case SyscallStatus::OutOfGas:
                    return {.status = StatusCode::OutOfGas};
                case SyscallStatus::Abort:
                    return {
                        .status = StatusCode::Abort,
                        .abort_code = result.values[0]};
                case SyscallStatus::Fatal:
                    return {.status = StatusCode::HostFailure};
                }
                stack_.resize(stack_.size() - sig->num_args);
                for (uint8_t i = 0; i < sig->num_results; ++i) {
                    if (FVM_UNLIKELY(!push(result.values[i]))) {
                        return {.status = StatusCode::StackOverflow};
                    }
                }
                if (FVM_UNLIKELY(!push(result.error))) {
                    return {.status = StatusCode::StackOverflow};
                }
                break;
            }
            case RETURN: {
                uint64_t const len = pop();
                uint64_t const offset = pop();
                if (FVM_UNLIKELY(!memory_.in_bounds(offset, len))) {
                    return {.status = StatusCode::MemoryOutOfBounds};
                }
                return {
                    .status = StatusCode::Success,
                    .output = byte_string{memory_.view(offset, len)}};
            }
            case ABORT:
                return {.status = StatusCode::Abort, .abort_code = pop()};
            default:
                // rejected at compile time
                FVM_ABORT("unvalidated opcode");
            }

            pc = next;
        }

        return {.status = StatusCode::Success};
    }
}
