#ifndef BX_AGGREGATOR_HPP
#define BX_AGGREGATOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <absl/container/node_hash_map.h>

#include <bx++/amount.hpp>
#include <bx++/account.hpp>
#include <bx++/block.hpp>
#include <bx++/sync_state.hpp>

namespace bx {

// everything a single block does to derived state
// invariant: sum of account balance deltas + fees + bonded == 0
struct block_effects
{
    absl::node_hash_map<std::string, bx::account_delta> accounts; // references stay valid across inserts
    bx::amount    fees;
    bx::amount    transferred;
    bx::amount    bonded;
    std::int64_t  blocks;
    std::int64_t  transactions;
    std::uint64_t height;
    bool          revert;

    block_effects()
    : fees(0)
    , transferred(0)
    , bonded(0)
    , blocks(0)
    , transactions(0)
    , height(0)
    , revert(false)
    {}
};

struct throughput
{
    double        current_tps;
    double        avg_tps_1h;
    double        avg_block_time;
    std::uint64_t blocks_in_window;
    std::uint64_t txs_in_window;

    throughput()
    : current_tps(0)
    , avg_tps_1h(0)
    , avg_block_time(0)
    , blocks_in_window(0)
    , txs_in_window(0)
    {}
};

namespace aggregator {

constexpr std::size_t   current_tps_blocks      { 10 };
constexpr std::int64_t  default_window_seconds  { 3600 };

bx::block_effects apply_block(const bx::block& block);

// exact negation of apply_block, fields that cannot be negated are
// restored from history when the delta is applied
bx::block_effects revert_block(const bx::block& block);

// throws bx::integrity_fault when a counter would go below zero
bx::account apply_delta(
    const bx::account&         acc,
    const bx::account_delta&   delta,
    const bx::account_history& history
);

void apply_totals(
    bx::chain_totals&        totals,
    const bx::block_effects& effects
);

// only blocks with a timestamp in [now - window, now] contribute
bx::throughput update_throughput_window(
    const std::vector<bx::block>& recent_blocks,
    const std::int64_t            now,
    const std::int64_t            window = default_window_seconds
);

}

}

#endif
