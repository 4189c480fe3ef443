#include <algorithm>
#include <vector>
#include <string>
#include <bx++/aggregator.hpp>
#include <bx++/error.hpp>

namespace bx {

namespace aggregator {

namespace {

bx::account_delta & touch(
    bx::block_effects & effects,
    const std::string & address
) {
    bx::account_delta & d = effects.accounts[address];
    d.height = effects.height;
    return d;
}

std::uint64_t apply_counter(
    const std::uint64_t current,
    const std::int64_t  delta,
    const std::string & address,
    const std::uint64_t height,
    const char *        name
) {
    const std::int64_t ret = static_cast<std::int64_t>(current) + delta;
    if (ret < 0) {
        throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, height,
            "counter " + std::string(name) + " of " + address + " would become negative"
        );
    }

    return static_cast<std::uint64_t>(ret);
}

}

bx::block_effects apply_block(const bx::block& block)
{
    bx::block_effects effects;
    effects.height       = block.height;
    effects.blocks       = 1;
    effects.transactions = static_cast<std::int64_t>(block.txs.size());

    for (const bx::transaction & tx : block.txs) {
        bx::account_delta & sender = touch(effects, tx.from_address);
        sender.balance -= tx.fee;
        sender.tx_count      += 1;
        sender.tx_sent_count += 1;
        sender.next_nonce = std::max(sender.next_nonce.value_or(0), tx.nonce + 1);
        effects.fees += tx.fee;

        switch (tx.type) {
            case bx::tx_type::stake:
            case bx::tx_type::delegate:
                sender.balance -= tx.value;
                effects.bonded += tx.value;
                if (tx.type == bx::tx_type::stake) {
                    sender.staked = true;
                }
                break;

            case bx::tx_type::unstake:
            case bx::tx_type::undelegate:
                sender.balance += tx.value;
                effects.bonded -= tx.value;
                break;

            default:
                // value only moves when there is somewhere for it to go
                if (tx.has_recipient()) {
                    sender.balance -= tx.value;
                    touch(effects, *tx.to_address).balance += tx.value;
                }
                if (tx.type == bx::tx_type::transfer) {
                    effects.transferred += tx.value;
                }
                break;
        }

        if (tx.has_recipient()) {
            bx::account_delta & recipient = touch(effects, *tx.to_address);
            recipient.tx_received_count += 1;
            if (*tx.to_address != tx.from_address) {
                recipient.tx_count += 1;
            }
        }
    }

    return effects;
}

bx::block_effects revert_block(const bx::block& block)
{
    bx::block_effects effects = apply_block(block);
    effects.revert        = true;
    effects.fees          = -effects.fees;
    effects.transferred   = -effects.transferred;
    effects.bonded        = -effects.bonded;
    effects.blocks        = -effects.blocks;
    effects.transactions  = -effects.transactions;

    for (auto & m : effects.accounts) {
        bx::account_delta & d = m.second;
        d.balance           = -d.balance;
        d.tx_count          = -d.tx_count;
        d.tx_sent_count     = -d.tx_sent_count;
        d.tx_received_count = -d.tx_received_count;
        d.revert            = true;
    }

    return effects;
}

bx::account apply_delta(
    const bx::account&         acc,
    const bx::account_delta&   delta,
    const bx::account_history& history
) {
    bx::account ret = acc;

    ret.balance          += delta.balance;
    ret.tx_count          = apply_counter(acc.tx_count,          delta.tx_count,          acc.address, delta.height, "tx_count");
    ret.tx_sent_count     = apply_counter(acc.tx_sent_count,     delta.tx_sent_count,     acc.address, delta.height, "tx_sent_count");
    ret.tx_received_count = apply_counter(acc.tx_received_count, delta.tx_received_count, acc.address, delta.height, "tx_received_count");

    if (! delta.revert) {
        if (delta.tx_count > 0 || delta.tx_received_count > 0) {
            if (! ret.first_seen_height.has_value()) {
                ret.first_seen_height = delta.height;
            }
            ret.last_seen_height = std::max(ret.last_seen_height.value_or(0), delta.height);
        }
        if (delta.next_nonce.has_value()) {
            ret.nonce = std::max(ret.nonce, *delta.next_nonce);
        }
        if (delta.staked) {
            ret.is_validator = true;
        }

        return ret;
    }

    // last seen, nonce and validator status of an account depend on which
    // earlier block touched it, so they come from what history remains
    ret.last_seen_height = history.last_seen_height;
    ret.nonce            = history.next_nonce.value_or(0);
    ret.is_validator     = history.is_validator;
    if (ret.tx_count == 0 && ret.tx_received_count == 0) {
        ret.first_seen_height.reset();
        ret.last_seen_height.reset();
    }

    return ret;
}

void apply_totals(
    bx::chain_totals&        totals,
    const bx::block_effects& effects
) {
    totals.fees        += effects.fees;
    totals.transferred += effects.transferred;
    totals.bonded      += effects.bonded;

    const std::int64_t blocks       = static_cast<std::int64_t>(totals.blocks) + effects.blocks;
    const std::int64_t transactions = static_cast<std::int64_t>(totals.transactions) + effects.transactions;
    if (blocks < 0 || transactions < 0) {
        throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, effects.height,
            "chain totals would become negative"
        );
    }

    totals.blocks       = static_cast<std::uint64_t>(blocks);
    totals.transactions = static_cast<std::uint64_t>(transactions);
}

bx::throughput update_throughput_window(
    const std::vector<bx::block>& recent_blocks,
    const std::int64_t            now,
    const std::int64_t            window
) {
    std::vector<const bx::block*> in_window;
    in_window.reserve(recent_blocks.size());
    for (const bx::block & b : recent_blocks) {
        if (b.timestamp >= now - window && b.timestamp <= now) {
            in_window.push_back(&b);
        }
    }

    std::sort(in_window.begin(), in_window.end(), [](const bx::block* a, const bx::block* b) {
        return a->height < b->height;
    });

    bx::throughput ret;
    ret.blocks_in_window = in_window.size();
    for (const bx::block* b : in_window) {
        ret.txs_in_window += b->tx_count;
    }

    if (in_window.size() < 2) {
        return ret;
    }

    const std::int64_t span = std::max<std::int64_t>(
        in_window.back()->timestamp - in_window.front()->timestamp, 1
    );

    ret.avg_tps_1h     = static_cast<double>(ret.txs_in_window) / static_cast<double>(span);
    ret.avg_block_time = static_cast<double>(span) / static_cast<double>(in_window.size() - 1);

    const std::size_t recent_begin = in_window.size() > current_tps_blocks
        ? in_window.size() - current_tps_blocks
        : 0;

    std::uint64_t recent_txs = 0;
    for (std::size_t i=recent_begin; i<in_window.size(); ++i) {
        recent_txs += in_window[i]->tx_count;
    }

    const std::int64_t recent_time = in_window.back()->timestamp - in_window[recent_begin]->timestamp;
    if (recent_time > 0) {
        ret.current_tps = static_cast<double>(recent_txs) / static_cast<double>(recent_time);
    }

    return ret;
}

}

}
