#include <algorithm>
#include <string>
#include <spdlog/spdlog.h>
#include <bx++/reorg_detector.hpp>

namespace bx {

std::string to_string(const bx::reorg_status status)
{
    switch (status) {
        case bx::reorg_status::NONE:            return "none";
        case bx::reorg_status::DIVERGED:        return "diverged";
        case bx::reorg_status::UNAVAILABLE:     return "unavailable";
        case bx::reorg_status::MISSING:         return "missing";
        case bx::reorg_status::BEYOND_LOOKBACK: return "beyond lookback";
    }

    return "unknown";
}

namespace {

// compares stored hashes against the node over [low .. high] ascending,
// the first mismatch is the fork point
bx::divergence scan(
    bx::node_client &   node,
    bx::store &         db,
    const std::uint64_t low,
    const std::uint64_t high,
    const std::uint64_t genesis_height
) {
    bx::divergence ret;

    for (std::uint64_t h=low; h<=high; ++h) {
        const std::optional<bx::blockhash> ours = db.get_block_hash(h);
        if (! ours) {
            spdlog::warn("reorg_detector: no stored block at {}", h);
            continue;
        }

        const std::pair<bx::node_status, bx::block> theirs = node.get_block(h);
        if (theirs.first == bx::node_status::NOT_FOUND) {
            ret.status   = bx::reorg_status::MISSING;
            ret.height   = h;
            ret.old_hash = *ours;
            return ret;
        }
        if (theirs.first != bx::node_status::OK || theirs.second.height != h) {
            ret.status = bx::reorg_status::UNAVAILABLE;
            ret.height = h;
            return ret;
        }

        if (theirs.second.hash == *ours) {
            continue;
        }

        ret.status   = bx::reorg_status::DIVERGED;
        ret.height   = h;
        ret.old_hash = *ours;
        ret.new_hash = theirs.second.hash;

        // the fork may start below what we compared
        if (h == low && h > genesis_height) {
            const std::optional<bx::blockhash> below = db.get_block_hash(h - 1);
            if (below && ! theirs.second.links_to(*below)) {
                ret.status = bx::reorg_status::BEYOND_LOOKBACK;
            }
        }

        spdlog::warn("reorg_detector: {} at {} ours {} node {}",
            bx::to_string(ret.status), h, ret.old_hash.decompress(), ret.new_hash.decompress()
        );

        return ret;
    }

    return ret;
}

}

bx::divergence reorg_detector::find_divergence(const std::int64_t tip)
{
    if (tip < static_cast<std::int64_t>(genesis_height) || depth == 0) {
        return bx::divergence();
    }

    const std::int64_t low = std::max(
        static_cast<std::int64_t>(genesis_height),
        tip - static_cast<std::int64_t>(depth) + 1
    );

    spdlog::debug("reorg_detector: checking {}..{}", low, tip);
    return scan(node, db, static_cast<std::uint64_t>(low), static_cast<std::uint64_t>(tip), genesis_height);
}

bx::divergence reorg_detector::verify_range(
    const std::uint64_t from,
    const std::uint64_t to
) {
    const bx::sync_state sync = db.get_sync_state();
    if (sync.indexed_height < static_cast<std::int64_t>(genesis_height)) {
        return bx::divergence();
    }

    const std::uint64_t low  = std::max(from, genesis_height);
    const std::uint64_t high = std::min(to, static_cast<std::uint64_t>(sync.indexed_height));
    if (low > high) {
        return bx::divergence();
    }

    spdlog::info("reorg_detector: verifying {}..{}", low, high);
    return scan(node, db, low, high, genesis_height);
}

}
