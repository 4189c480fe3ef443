#ifndef BX_BHASH_HPP
#define BX_BHASH_HPP

#include <string>
#include <array>
#include <utility>
#include <algorithm>
#include <absl/hash/hash.h>
#include <bx++/util.hpp>


namespace bx {

// do not use this directly, instead use one of the typedefs below
template <typename Tag, unsigned Size = 32>
struct bhash
{
    std::array<std::uint8_t, Size> v;

    bhash()
    : v({ 0 })
    {}

    // accepts either raw bytes or lowercase/uppercase hex of twice the size
    // anything else produces the null hash, use from_hex to detect that
    template <typename Container>
    explicit bhash(const Container& v_)
    : v({ 0 })
    {
        if (v_.size() == Size) {
            std::copy(v_.begin(), v_.end(), v.data());
        } else if (v_.size() == Size*2) {
            const std::pair<bool, std::vector<std::uint8_t>> bytes = bx::util::unhex(v_);
            if (bytes.first) {
                std::copy(bytes.second.begin(), bytes.second.end(), v.data());
            }
        }
    }

    static std::pair<bool, bhash<Tag, Size>> from_hex(const std::string& s)
    {
        if (s.size() != Size*2) {
            return { false, {} };
        }

        const std::pair<bool, std::vector<std::uint8_t>> bytes = bx::util::unhex(s);
        if (! bytes.first) {
            return { false, {} };
        }

        bhash<Tag, Size> ret;
        std::copy(bytes.second.begin(), bytes.second.end(), ret.v.data());
        return { true, ret };
    }

    constexpr auto size() const -> decltype(v.size())
    { return v.size(); }

    auto data() -> decltype(v.data())
    { return v.data(); }

    auto data() const -> decltype(v.data())
    { return v.data(); }

    auto begin() -> decltype(v.begin())
    { return v.begin(); }

    auto end() -> decltype(v.end())
    { return v.end(); }

    bool is_null() const
    {
        return std::all_of(v.begin(), v.end(), [](const std::uint8_t c) { return c == 0; });
    }

    bool operator==(const bhash<Tag, Size> &o) const
    { return v == o.v; }

    bool operator!=(const bhash<Tag, Size> &o) const
    { return ! operator==(o); }

    template <typename H>
    friend H AbslHashValue(H h, const bhash<Tag, Size>& m)
    {
        return H::combine(std::move(h), m.v);
    }

    std::string decompress() const
    {
        return bx::util::hex(v);
    }
};

using blockhash = bhash<struct bblockhash>;
using txhash    = bhash<struct btxhash>;

}

#endif
