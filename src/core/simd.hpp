/*
 * Copyright 2025 Waypoint Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Waypoint SIMD String Primitives
// Byte scans and comparisons used while walking route patterns and request paths
//
// Dispatch is compile-time only:
// - x86_64: SSE2 (always available on the target)
// - ARM64: NEON
// - anything else: scalar

#pragma once

#include <cstddef>
#include <cstdint>

#if defined(__x86_64__) || defined(_M_X64)
    #include <emmintrin.h>
    #define WAYPOINT_SIMD_SSE2 1
#elif defined(__aarch64__) || defined(_M_ARM64)
    #include <arm_neon.h>
    #define WAYPOINT_SIMD_NEON 1
#endif

namespace waypoint::simd {

// Bit index of the lowest set bit in a non-zero 16-lane mask
inline unsigned first_lane(unsigned mask) noexcept {
    return static_cast<unsigned>(__builtin_ctz(mask));
}

#if defined(WAYPOINT_SIMD_NEON)
// Returns the index of the first non-zero lane, or 16 when all lanes are zero
inline size_t first_set_lane(uint8x16_t v) noexcept {
    const uint64_t lo = vgetq_lane_u64(vreinterpretq_u64_u8(v), 0);
    if (lo != 0) {
        return static_cast<size_t>(__builtin_ctzll(lo)) / 8;
    }
    const uint64_t hi = vgetq_lane_u64(vreinterpretq_u64_u8(v), 1);
    if (hi != 0) {
        return 8 + static_cast<size_t>(__builtin_ctzll(hi)) / 8;
    }
    return 16;
}
#endif

// Find first occurrence of ch in [data, data + len)
// Returns the offset, or len if not found
inline size_t find_char(const char* data, size_t len, char ch) noexcept {
    size_t i = 0;

#if defined(WAYPOINT_SIMD_SSE2)
    const __m128i needle = _mm_set1_epi8(ch);
    for (; i + 16 <= len; i += 16) {
        const __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
        const unsigned mask = static_cast<unsigned>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk, needle)));
        if (mask != 0) {
            return i + first_lane(mask);
        }
    }
#elif defined(WAYPOINT_SIMD_NEON)
    const uint8x16_t needle = vdupq_n_u8(static_cast<uint8_t>(ch));
    for (; i + 16 <= len; i += 16) {
        const uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(data + i));
        const size_t lane = first_set_lane(vceqq_u8(chunk, needle));
        if (lane != 16) {
            return i + lane;
        }
    }
#endif

    for (; i < len; ++i) {
        if (data[i] == ch) {
            return i;
        }
    }
    return len;
}

// Find first ':' or '*' (wildcard markers in a route pattern)
// Returns the offset, or len if the pattern is fully static
inline size_t find_wildcard_marker(const char* data, size_t len) noexcept {
    size_t i = 0;

#if defined(WAYPOINT_SIMD_SSE2)
    const __m128i colon = _mm_set1_epi8(':');
    const __m128i star = _mm_set1_epi8('*');
    for (; i + 16 <= len; i += 16) {
        const __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(data + i));
        const __m128i hit = _mm_or_si128(_mm_cmpeq_epi8(chunk, colon), _mm_cmpeq_epi8(chunk, star));
        const unsigned mask = static_cast<unsigned>(_mm_movemask_epi8(hit));
        if (mask != 0) {
            return i + first_lane(mask);
        }
    }
#elif defined(WAYPOINT_SIMD_NEON)
    const uint8x16_t colon = vdupq_n_u8(':');
    const uint8x16_t star = vdupq_n_u8('*');
    for (; i + 16 <= len; i += 16) {
        const uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(data + i));
        const size_t lane = first_set_lane(vorrq_u8(vceqq_u8(chunk, colon), vceqq_u8(chunk, star)));
        if (lane != 16) {
            return i + lane;
        }
    }
#endif

    for (; i < len; ++i) {
        if (data[i] == ':' || data[i] == '*') {
            return i;
        }
    }
    return len;
}

// Number of matching bytes from the start of a and b (both at least len long)
inline size_t common_prefix_length(const char* a, const char* b, size_t len) noexcept {
    size_t i = 0;

#if defined(WAYPOINT_SIMD_SSE2)
    for (; i + 16 <= len; i += 16) {
        const __m128i chunk_a = _mm_loadu_si128(reinterpret_cast<const __m128i*>(a + i));
        const __m128i chunk_b = _mm_loadu_si128(reinterpret_cast<const __m128i*>(b + i));
        const unsigned eq = static_cast<unsigned>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk_a, chunk_b)));
        if (eq != 0xFFFF) {
            return i + first_lane(~eq & 0xFFFF);
        }
    }
#elif defined(WAYPOINT_SIMD_NEON)
    for (; i + 16 <= len; i += 16) {
        const uint8x16_t chunk_a = vld1q_u8(reinterpret_cast<const uint8_t*>(a + i));
        const uint8x16_t chunk_b = vld1q_u8(reinterpret_cast<const uint8_t*>(b + i));
        const size_t lane = first_set_lane(vmvnq_u8(vceqq_u8(chunk_a, chunk_b)));
        if (lane != 16) {
            return i + lane;
        }
    }
#endif

    while (i < len && a[i] == b[i]) {
        ++i;
    }
    return i;
}

// ASCII-only lowercase; bytes >= 0x80 pass through untouched
inline char to_lower(char c) noexcept {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

// ASCII case-insensitive equality of two len-byte buffers
inline bool equals_ignore_case(const char* a, const char* b, size_t len) noexcept {
    size_t i = 0;

#if defined(WAYPOINT_SIMD_SSE2)
    // Fold 'A'..'Z' by setting bit 0x20 where the byte is in range
    const __m128i upper_lo = _mm_set1_epi8('A' - 1);
    const __m128i upper_hi = _mm_set1_epi8('Z' + 1);
    const __m128i case_bit = _mm_set1_epi8(0x20);
    auto fold = [&](__m128i v) {
        const __m128i is_upper = _mm_and_si128(_mm_cmpgt_epi8(v, upper_lo), _mm_cmplt_epi8(v, upper_hi));
        return _mm_or_si128(v, _mm_and_si128(is_upper, case_bit));
    };
    for (; i + 16 <= len; i += 16) {
        const __m128i chunk_a = fold(_mm_loadu_si128(reinterpret_cast<const __m128i*>(a + i)));
        const __m128i chunk_b = fold(_mm_loadu_si128(reinterpret_cast<const __m128i*>(b + i)));
        if (_mm_movemask_epi8(_mm_cmpeq_epi8(chunk_a, chunk_b)) != 0xFFFF) {
            return false;
        }
    }
#endif

    for (; i < len; ++i) {
        if (to_lower(a[i]) != to_lower(b[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace waypoint::simd
