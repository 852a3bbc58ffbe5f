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

#include <fvm/core/byte_string.hpp>
#include <fvm/core/bytes.hpp>
#include <fvm/core/int.hpp>
#include <fvm/core/likely.h>
#include <fvm/core/result.hpp>
#include <fvm/core/rlp/config.hpp>
#include <fvm/core/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>

FVM_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
constexpr Result<T> decode_raw_num(byte_string_view const enc)
{
    if (FVM_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }

    if (enc.empty()) {
        return T{0};
    }

    if (enc[0] == 0) {
        return DecodeError::LeadingZero;
    }

    T result{};
    std::memcpy(
        &intx::as_bytes(result)[sizeof(T) - enc.size()],
        enc.data(),
        enc.size());
    result = intx::to_big_endian(result);
    return result;
}

constexpr Result<size_t> decode_length(byte_string_view const enc)
{
    return decode_raw_num<size_t>(enc);
}

constexpr Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t end = 0;

    if (FVM_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (FVM_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0x80) // [0x00, 0x7f]
    {
        end = i + 1;
    }
    else if (enc[0] < 0xb8) // [0x80, 0xb7]
    {
        ++i;
        uint8_t const length = enc[0] - 0x80;
        end = i + length;
    }
    else // [0xb8, 0xbf]
    {
        ++i;
        uint8_t const length_of_length = enc[0] - 0xb7;

        if (FVM_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            auto const length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
        end = i + length;
    }

    if (FVM_UNLIKELY(end > enc.size())) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    size_t i = 1;
    size_t length;

    if (FVM_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (FVM_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;

        if (FVM_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
    }
    auto const end = i + length;

    if (FVM_UNLIKELY(end > enc.size())) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

template <unsigned_integral T>
constexpr Result<T> decode_unsigned(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    return decode_raw_num<T>(payload);
}

inline Result<bytes32_t> decode_bytes32(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (FVM_UNLIKELY(payload.size() != sizeof(bytes32_t))) {
        return DecodeError::ArrayLengthUnexpected;
    }
    return to_bytes(payload);
}

FVM_RLP_NAMESPACE_END
