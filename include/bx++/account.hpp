#ifndef BX_ACCOUNT_HPP
#define BX_ACCOUNT_HPP

#include <cstdint>
#include <string>
#include <optional>

#include <bx++/amount.hpp>

namespace bx {

struct account
{
    std::string   address;
    bx::amount    balance;
    std::uint64_t nonce; // next expected nonce, ie highest sent nonce + 1
    std::uint64_t tx_count;
    std::uint64_t tx_sent_count;
    std::uint64_t tx_received_count;
    std::optional<std::uint64_t> first_seen_height;
    std::optional<std::uint64_t> last_seen_height;
    bool          is_validator;

    account()
    : balance(0)
    , nonce(0)
    , tx_count(0)
    , tx_sent_count(0)
    , tx_received_count(0)
    , is_validator(false)
    {}

    explicit account(const std::string& address)
    : account()
    {
        this->address = address;
    }
};

// signed change attributable to a single block
struct account_delta
{
    bx::amount    balance;
    std::int64_t  tx_count;
    std::int64_t  tx_sent_count;
    std::int64_t  tx_received_count;
    std::optional<std::uint64_t> next_nonce; // highest nonce sent in the block + 1
    bool          staked;
    std::uint64_t height;
    bool          revert;

    account_delta()
    : balance(0)
    , tx_count(0)
    , tx_sent_count(0)
    , tx_received_count(0)
    , staked(false)
    , height(0)
    , revert(false)
    {}

    bool is_zero() const
    {
        return balance == 0
            && tx_count == 0
            && tx_sent_count == 0
            && tx_received_count == 0;
    }
};

// what remains of an account's activity strictly below a height
// used to restore the fields a revert cannot invert algebraically
struct account_history
{
    std::optional<std::uint64_t> last_seen_height;
    std::optional<std::uint64_t> next_nonce;
    bool                         is_validator;

    account_history()
    : is_validator(false)
    {}
};

}

#endif
