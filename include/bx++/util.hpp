#ifndef BX_UTIL_HPP
#define BX_UTIL_HPP

#include <cstdint>
#include <array>
#include <vector>
#include <string>
#include <utility>


namespace bx {

namespace util {

template <typename Container>
std::string hex(const Container& v)
{
    constexpr std::array<char, 16> chars = {
        '0', '1', '2', '3', '4', '5', '6', '7',
        '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'
    };

    std::string ret(v.size()*2, '\0');
    for (unsigned i=0; i<v.size(); ++i) {
        const std::uint8_t c = static_cast<std::uint8_t>(v[i]);
        ret[(i<<1)+0] = chars[c >> 4];
        ret[(i<<1)+1] = chars[c & 0x0F];
    }

    return ret;
}

inline int hex_digit(const char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

template <typename Container>
std::pair<bool, std::vector<std::uint8_t>> unhex(const Container& v_)
{
    if (v_.size() % 2 != 0) {
        return { false, {} };
    }

    std::vector<std::uint8_t> ret(v_.size() / 2);

    for (unsigned i=0; i<ret.size(); ++i) {
        const int p1 = hex_digit(v_[(i<<1)+0]);
        const int p2 = hex_digit(v_[(i<<1)+1]);

        if (p1 < 0 || p2 < 0) {
            return { false, {} };
        }

        ret[i] = static_cast<std::uint8_t>((p1 << 4) + p2);
    }

    return { true, ret };
}

// seconds since unix epoch
std::int64_t current_time();

}

}

#endif
