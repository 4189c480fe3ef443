#ifndef BX_BLOCK_HPP
#define BX_BLOCK_HPP

#include <cstdint>
#include <vector>
#include <string>
#include <iostream>

#include <bx++/bhash.hpp>
#include <bx++/transaction.hpp>

namespace bx {

struct block
{
    std::uint64_t height;
    bx::blockhash hash;
    bx::blockhash prev_hash; // null for the genesis block
    std::int64_t  timestamp; // unix seconds
    std::string   chain_id;
    std::string   proposer_address;
    std::string   tx_root;
    std::string   state_root;
    std::uint64_t gas_used;
    std::uint64_t gas_limit;
    std::uint32_t tx_count;
    std::vector<bx::transaction> txs;

    block()
    : height(0)
    , timestamp(0)
    , gas_used(0)
    , gas_limit(0)
    , tx_count(0)
    {}

    // true when this block extends the chain whose tip is `parent`
    bool links_to(const bx::blockhash& parent) const
    {
        return prev_hash == parent;
    }
};

}

std::ostream & operator<<(std::ostream &os, const bx::block & block);

#endif
