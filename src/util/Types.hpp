#pragma once
// Types.hpp - Fixed-width aliases and small value types shared everywhere

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rs {

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;
using f32 = float;
using f64 = double;
using usize = std::size_t;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

struct Color {
    u8 r{0};
    u8 g{0};
    u8 b{0};
    u8 a{255};

    static constexpr Color black() {
        return {0, 0, 0, 255};
    }
    static constexpr Color white() {
        return {255, 255, 255, 255};
    }

    // Accepts "#RRGGBB" or "#RRGGBBAA"; anything else yields black
    static Color fromHex(std::string_view hex) {
        if (!hex.empty() && hex.front() == '#') {
            hex.remove_prefix(1);
        }
        if (hex.size() != 6 && hex.size() != 8) {
            return black();
        }

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f') {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F') {
                return c - 'A' + 10;
            }
            return -1;
        };
        auto byteAt = [&](usize i) -> int {
            int hi = nibble(hex[i]);
            int lo = nibble(hex[i + 1]);
            return (hi < 0 || lo < 0) ? -1 : hi * 16 + lo;
        };

        Color c;
        int r = byteAt(0), g = byteAt(2), b = byteAt(4);
        int a = hex.size() == 8 ? byteAt(6) : 255;
        if (r < 0 || g < 0 || b < 0 || a < 0) {
            return black();
        }
        c.r = static_cast<u8>(r);
        c.g = static_cast<u8>(g);
        c.b = static_cast<u8>(b);
        c.a = static_cast<u8>(a);
        return c;
    }

    std::string toHex() const {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string out = "#";
        for (u8 v : {r, g, b}) {
            out += digits[v >> 4];
            out += digits[v & 0x0F];
        }
        if (a != 255) {
            out += digits[a >> 4];
            out += digits[a & 0x0F];
        }
        return out;
    }

    bool operator==(const Color&) const = default;
};

} // namespace rs
