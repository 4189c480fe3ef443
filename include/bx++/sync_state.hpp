#ifndef BX_SYNC_STATE_HPP
#define BX_SYNC_STATE_HPP

#include <cstdint>
#include <string>

#include <bx++/bhash.hpp>
#include <bx++/amount.hpp>

namespace bx {

struct sync_state
{
    std::int64_t  indexed_height; // -1 until the first block is committed
    bx::blockhash tip_hash;
    std::int64_t  last_poll; // unix seconds of last successful poll

    sync_state()
    : indexed_height(-1)
    , last_poll(0)
    {}

    bool empty() const
    { return indexed_height < 0; }
};

struct chain_totals
{
    bx::amount    fees;        // fee sink, never credited to an account
    bx::amount    transferred; // value moved by TRANSFER transactions
    bx::amount    bonded;      // stake + delegate - unstake - undelegate
    std::uint64_t blocks;
    std::uint64_t transactions;

    chain_totals()
    : fees(0)
    , transferred(0)
    , bonded(0)
    , blocks(0)
    , transactions(0)
    {}
};

struct reorg_event
{
    std::uint64_t height;
    bx::blockhash old_hash;
    bx::blockhash new_hash;
    std::uint64_t blocks_reverted;
    std::int64_t  detected_at;

    reorg_event()
    : height(0)
    , blocks_reverted(0)
    , detected_at(0)
    {}
};

}

#endif
