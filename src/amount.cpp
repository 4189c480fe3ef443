#include <string>
#include <bx++/amount.hpp>

namespace bx {

std::pair<bool, bx::amount> parse_amount(const std::string& s)
{
    if (s.empty()) {
        return { false, 0 };
    }

    std::size_t i = 0;
    bool negative = false;
    if (s[0] == '-' || s[0] == '+') {
        negative = s[0] == '-';
        ++i;
    }

    if (i == s.size()) {
        return { false, 0 };
    }

    bx::amount ret = 0;
    for (; i<s.size(); ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') {
            return { false, 0 };
        }

        ret *= 10;
        ret += c - '0';
    }

    if (negative) {
        ret = -ret;
    }

    return { true, ret };
}

std::string to_string(const bx::amount& a)
{
    return a.str();
}

}
