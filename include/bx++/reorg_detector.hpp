#ifndef BX_REORG_DETECTOR_HPP
#define BX_REORG_DETECTOR_HPP

#include <cstdint>
#include <string>
#include <bx++/bhash.hpp>
#include <bx++/node_client.hpp>
#include <bx++/store.hpp>

namespace bx {

enum class reorg_status
{
    NONE,            // every compared height matches
    DIVERGED,        // fork point found
    UNAVAILABLE,     // node failed mid-scan, nothing can be concluded
    MISSING,         // node no longer has a height it advertised before
    BEYOND_LOOKBACK  // oldest compared height differs and does not link below
};

std::string to_string(const bx::reorg_status status);

struct divergence
{
    bx::reorg_status status;
    std::uint64_t    height;
    bx::blockhash    old_hash; // ours
    bx::blockhash    new_hash; // node's

    divergence()
    : status(bx::reorg_status::NONE)
    , height(0)
    {}
};

struct reorg_detector
{
    bx::node_client & node;
    bx::store &       db;
    std::uint32_t     depth;
    std::uint64_t     genesis_height;

    reorg_detector(
        bx::node_client &   node,
        bx::store &         db,
        const std::uint32_t depth,
        const std::uint64_t genesis_height
    )
    : node(node)
    , db(db)
    , depth(depth)
    , genesis_height(genesis_height)
    {}

    // scans [max(genesis, tip-depth+1) .. tip] ascending
    bx::divergence find_divergence(const std::int64_t tip);

    // scans [from .. to] ascending, clamped to what is stored locally
    bx::divergence verify_range(
        const std::uint64_t from,
        const std::uint64_t to
    );
};

}

#endif
