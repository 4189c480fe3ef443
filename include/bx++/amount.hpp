#ifndef BX_AMOUNT_HPP
#define BX_AMOUNT_HPP

#include <string>
#include <utility>
#include <boost/multiprecision/cpp_int.hpp>


namespace bx {

// balances, fees and transfer values are exact integers of unbounded size
// never convert these to floating point
using amount = boost::multiprecision::cpp_int;

// parses a base-10 integer, optionally signed, no whitespace or exponents
std::pair<bool, bx::amount> parse_amount(const std::string& s);

std::string to_string(const bx::amount& a);

}

#endif
