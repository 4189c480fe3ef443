#ifndef BX_CODEC_HPP
#define BX_CODEC_HPP

#include <cstdint>
#include <string>
#include <array>
#include <utility>

#include <nlohmann/json.hpp>

#include <bx++/bhash.hpp>
#include <bx++/amount.hpp>
#include <bx++/block.hpp>
#include <bx++/sync_state.hpp>

// translation between the node's json bodies and bx types

namespace bx {

namespace codec {

// sorted keys, ", " and ": " separators, ascii escaped
// this matches what the node's reference tooling hashes
std::string canonical_dump(const nlohmann::json& obj);

std::array<std::uint8_t, 32> sha256(const std::string& data);

bx::blockhash compute_block_hash(const nlohmann::json& header);
bx::txhash    compute_tx_hash(const nlohmann::json& tx);

// accepts json integers and base-10 strings, rejects negatives and fractions
std::pair<bool, bx::amount> amount_from_json(const nlohmann::json& j);

// { "header": {...}, "txs": [...] }
std::pair<bool, bx::block> block_from_json(const nlohmann::json& j);

nlohmann::json block_to_json(const bx::block& block);
nlohmann::json reorg_event_to_json(const bx::reorg_event& event);

// reads a gauge from prometheus text exposition format
std::pair<bool, std::uint64_t> parse_height_metric(
    const std::string& body,
    const std::string& metric
);

}

}

#endif
