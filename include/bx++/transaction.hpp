#ifndef BX_TRANSACTION_HPP
#define BX_TRANSACTION_HPP

#include <cstdint>
#include <string>
#include <optional>
#include <utility>
#include <iostream>

#include <bx++/bhash.hpp>
#include <bx++/amount.hpp>

namespace bx {

enum class tx_type
{
    transfer,
    stake,
    unstake,
    delegate,
    undelegate,
    update_validator,
    unjail,
    compute,
    submit_result
};

// names match the node's wire format, ie "TRANSFER"
std::string to_string(const bx::tx_type type);
std::pair<bool, bx::tx_type> tx_type_from_string(const std::string& s);

struct transaction
{
    bx::txhash    hash;
    std::uint64_t block_height;
    std::uint32_t tx_index; // position within the block
    bx::tx_type   type;

    std::string                from_address;
    std::optional<std::string> to_address;

    bx::amount    value; // "amount" on the wire
    bx::amount    fee;
    std::uint64_t nonce;

    std::uint64_t gas_price;
    std::uint64_t gas_limit;
    std::uint64_t gas_used;

    std::string signature;
    std::string pub_key;
    std::string payload; // json text

    transaction()
    : block_height(0)
    , tx_index(0)
    , type(bx::tx_type::transfer)
    , value(0)
    , fee(0)
    , nonce(0)
    , gas_price(0)
    , gas_limit(0)
    , gas_used(0)
    , payload("{}")
    {}

    bool has_recipient() const
    {
        return to_address.has_value() && ! to_address->empty();
    }
};

}

std::ostream & operator<<(std::ostream &os, const bx::transaction & tx);

#endif
