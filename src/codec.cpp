#include <cmath>
#include <string>
#include <sstream>
#include <vector>
#include <openssl/evp.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <bx++/util.hpp>
#include <bx++/codec.hpp>

namespace bx {

namespace codec {

namespace {

nlohmann::json get_or_null(const nlohmann::json& j, const char * key)
{
    if (j.contains(key)) {
        return j.at(key);
    }

    return nullptr;
}

std::string get_string(const nlohmann::json& j, const char * key)
{
    if (! j.contains(key) || ! j.at(key).is_string()) {
        return "";
    }

    return j.at(key).get<std::string>();
}

std::pair<bool, std::uint64_t> get_u64(
    const nlohmann::json& j,
    const char *          key,
    const std::uint64_t   def
) {
    if (! j.contains(key) || j.at(key).is_null()) {
        return { true, def };
    }

    const nlohmann::json & v = j.at(key);
    if (v.is_number_unsigned()) {
        return { true, v.get<std::uint64_t>() };
    }
    if (v.is_number_integer()) {
        const std::int64_t n = v.get<std::int64_t>();
        if (n < 0) {
            return { false, 0 };
        }
        return { true, static_cast<std::uint64_t>(n) };
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (d < 0 || std::floor(d) != d) {
            return { false, 0 };
        }
        return { true, static_cast<std::uint64_t>(d) };
    }

    return { false, 0 };
}

// node hashes are hex strings, an empty or all zero string is the null hash
template <typename Hash>
std::pair<bool, Hash> hash_from_json(const nlohmann::json& j, const char * key)
{
    const std::string s = get_string(j, key);
    if (s.empty()) {
        return { true, Hash() };
    }

    return Hash::from_hex(s);
}

}

std::string canonical_dump(const nlohmann::json& obj)
{
    if (obj.is_object()) {
        std::string ret = "{";
        bool first = true;
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (! first) {
                ret += ", ";
            }
            first = false;
            ret += nlohmann::json(it.key()).dump(-1, ' ', true);
            ret += ": ";
            ret += canonical_dump(it.value());
        }
        ret += "}";
        return ret;
    }

    if (obj.is_array()) {
        std::string ret = "[";
        bool first = true;
        for (const auto & m : obj) {
            if (! first) {
                ret += ", ";
            }
            first = false;
            ret += canonical_dump(m);
        }
        ret += "]";
        return ret;
    }

    return obj.dump(-1, ' ', true);
}

std::array<std::uint8_t, 32> sha256(const std::string& data)
{
    std::array<std::uint8_t, 32> ret = { 0 };
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), ret.data(), &len, EVP_sha256(), nullptr) != 1) {
        spdlog::error("sha256 digest failed");
        ret = { 0 };
    }

    return ret;
}

bx::blockhash compute_block_hash(const nlohmann::json& header)
{
    const nlohmann::json hash_input = {
        { "height",     get_or_null(header, "height") },
        { "prev_hash",  get_or_null(header, "prev_hash") },
        { "timestamp",  get_or_null(header, "timestamp") },
        { "tx_root",    get_or_null(header, "tx_root") },
        { "state_root", get_or_null(header, "state_root") },
    };

    return bx::blockhash(sha256(canonical_dump(hash_input)));
}

bx::txhash compute_tx_hash(const nlohmann::json& tx)
{
    const nlohmann::json hash_input = {
        { "tx_type",      get_or_null(tx, "tx_type") },
        { "from_address", get_or_null(tx, "from_address") },
        { "to_address",   get_or_null(tx, "to_address") },
        { "amount",       get_or_null(tx, "amount") },
        { "nonce",        get_or_null(tx, "nonce") },
        { "signature",    get_or_null(tx, "signature") },
    };

    return bx::txhash(sha256(canonical_dump(hash_input)));
}

std::pair<bool, bx::amount> amount_from_json(const nlohmann::json& j)
{
    if (j.is_null()) {
        return { true, 0 };
    }
    if (j.is_number_unsigned()) {
        return { true, bx::amount(j.get<std::uint64_t>()) };
    }
    if (j.is_number_integer()) {
        const std::int64_t n = j.get<std::int64_t>();
        if (n < 0) {
            return { false, 0 };
        }
        return { true, bx::amount(n) };
    }
    if (j.is_number_float()) {
        const double d = j.get<double>();
        if (d < 0 || std::floor(d) != d || ! std::isfinite(d)) {
            return { false, 0 };
        }
        return { true, bx::amount(d) };
    }
    if (j.is_string()) {
        const std::pair<bool, bx::amount> parsed = bx::parse_amount(j.get<std::string>());
        if (! parsed.first || parsed.second < 0) {
            return { false, 0 };
        }
        return parsed;
    }

    return { false, 0 };
}

std::pair<bool, bx::block> block_from_json(const nlohmann::json& j)
{
    if (! j.is_object() || ! j.contains("header") || ! j.at("header").is_object()) {
        spdlog::warn("block_from_json: missing header");
        return { false, {} };
    }

    const nlohmann::json & header = j.at("header");
    bx::block block;

    if (! header.contains("height")) {
        spdlog::warn("block_from_json: missing height");
        return { false, {} };
    }
    const std::pair<bool, std::uint64_t> height = get_u64(header, "height", 0);
    if (! height.first) {
        spdlog::warn("block_from_json: bad height");
        return { false, {} };
    }
    block.height = height.second;

    if (! get_string(j, "hash").empty()) {
        const std::pair<bool, bx::blockhash> hash = hash_from_json<bx::blockhash>(j, "hash");
        if (! hash.first) {
            spdlog::warn("block_from_json: bad hash at {}", block.height);
            return { false, {} };
        }
        block.hash = hash.second;
    } else {
        block.hash = compute_block_hash(header);
    }

    const std::pair<bool, bx::blockhash> prev_hash = hash_from_json<bx::blockhash>(header, "prev_hash");
    if (! prev_hash.first) {
        spdlog::warn("block_from_json: bad prev_hash at {}", block.height);
        return { false, {} };
    }
    block.prev_hash = prev_hash.second;

    if (header.contains("timestamp") && header.at("timestamp").is_number()) {
        block.timestamp = static_cast<std::int64_t>(header.at("timestamp").get<double>());
    }

    block.chain_id         = get_string(header, "chain_id");
    block.proposer_address = get_string(header, "proposer_address");
    block.tx_root          = get_string(header, "tx_root");
    block.state_root       = get_string(header, "state_root");

    const std::pair<bool, std::uint64_t> gas_used  = get_u64(header, "gas_used", 0);
    const std::pair<bool, std::uint64_t> gas_limit = get_u64(header, "gas_limit", 0);
    if (! gas_used.first || ! gas_limit.first) {
        spdlog::warn("block_from_json: bad gas at {}", block.height);
        return { false, {} };
    }
    block.gas_used  = gas_used.second;
    block.gas_limit = gas_limit.second;

    if (j.contains("txs") && ! j.at("txs").is_null()) {
        if (! j.at("txs").is_array()) {
            spdlog::warn("block_from_json: txs is not an array at {}", block.height);
            return { false, {} };
        }

        std::uint32_t idx = 0;
        for (const nlohmann::json & jtx : j.at("txs")) {
            if (! jtx.is_object()) {
                spdlog::warn("block_from_json: tx {} is not an object at {}", idx, block.height);
                return { false, {} };
            }

            bx::transaction tx;
            tx.block_height = block.height;
            tx.tx_index     = idx;

            if (! get_string(jtx, "hash").empty()) {
                const std::pair<bool, bx::txhash> hash = hash_from_json<bx::txhash>(jtx, "hash");
                if (! hash.first) {
                    spdlog::warn("block_from_json: bad tx hash {} at {}", idx, block.height);
                    return { false, {} };
                }
                tx.hash = hash.second;
            } else {
                tx.hash = compute_tx_hash(jtx);
            }

            const std::string type_str = jtx.contains("tx_type") ? get_string(jtx, "tx_type") : "TRANSFER";
            const std::pair<bool, bx::tx_type> type = bx::tx_type_from_string(type_str);
            if (! type.first) {
                spdlog::error("block_from_json: unknown tx_type {} at {}", type_str, block.height);
                return { false, {} };
            }
            tx.type = type.second;

            tx.from_address = get_string(jtx, "from_address");
            if (tx.from_address.empty()) {
                spdlog::warn("block_from_json: tx {} without sender at {}", idx, block.height);
                return { false, {} };
            }

            const std::string to_address = get_string(jtx, "to_address");
            if (! to_address.empty()) {
                tx.to_address = to_address;
            }

            const std::pair<bool, bx::amount> value = amount_from_json(get_or_null(jtx, "amount"));
            const std::pair<bool, bx::amount> fee   = amount_from_json(get_or_null(jtx, "fee"));
            if (! value.first || ! fee.first) {
                spdlog::warn("block_from_json: bad amount or fee in tx {} at {}", idx, block.height);
                return { false, {} };
            }
            tx.value = value.second;
            tx.fee   = fee.second;

            const std::pair<bool, std::uint64_t> nonce     = get_u64(jtx, "nonce", 0);
            const std::pair<bool, std::uint64_t> gas_price = get_u64(jtx, "gas_price", 0);
            const std::pair<bool, std::uint64_t> gas_limit = get_u64(jtx, "gas_limit", 0);
            const std::pair<bool, std::uint64_t> gas_used  = get_u64(jtx, "gas_used", gas_limit.second);
            if (! nonce.first || ! gas_price.first || ! gas_limit.first || ! gas_used.first) {
                spdlog::warn("block_from_json: bad nonce or gas in tx {} at {}", idx, block.height);
                return { false, {} };
            }
            tx.nonce     = nonce.second;
            tx.gas_price = gas_price.second;
            tx.gas_limit = gas_limit.second;
            tx.gas_used  = gas_used.second;

            tx.signature = get_string(jtx, "signature");
            tx.pub_key   = get_string(jtx, "pub_key");
            if (jtx.contains("payload") && ! jtx.at("payload").is_null()) {
                tx.payload = jtx.at("payload").dump();
            }

            block.txs.push_back(tx);
            ++idx;
        }
    }

    block.tx_count = static_cast<std::uint32_t>(block.txs.size());

    return { true, block };
}

nlohmann::json block_to_json(const bx::block& block)
{
    nlohmann::json txs = nlohmann::json::array();
    for (const bx::transaction & tx : block.txs) {
        txs.push_back({
            { "hash",         tx.hash.decompress() },
            { "tx_index",     tx.tx_index },
            { "tx_type",      bx::to_string(tx.type) },
            { "from_address", tx.from_address },
            { "to_address",   tx.has_recipient() ? nlohmann::json(*tx.to_address) : nlohmann::json(nullptr) },
            { "amount",       bx::to_string(tx.value) },
            { "fee",          bx::to_string(tx.fee) },
            { "nonce",        tx.nonce },
        });
    }

    return {
        { "hash", block.hash.decompress() },
        { "header", {
            { "height",           block.height },
            { "prev_hash",        block.prev_hash.decompress() },
            { "timestamp",        block.timestamp },
            { "chain_id",         block.chain_id },
            { "proposer_address", block.proposer_address },
            { "tx_root",          block.tx_root },
            { "state_root",       block.state_root },
            { "gas_used",         block.gas_used },
            { "gas_limit",        block.gas_limit },
        }},
        { "tx_count", block.tx_count },
        { "txs", txs },
    };
}

nlohmann::json reorg_event_to_json(const bx::reorg_event& event)
{
    return {
        { "height",          event.height },
        { "old_hash",        event.old_hash.decompress() },
        { "new_hash",        event.new_hash.decompress() },
        { "blocks_reverted", event.blocks_reverted },
        { "detected_at",     event.detected_at },
    };
}

std::pair<bool, std::uint64_t> parse_height_metric(
    const std::string& body,
    const std::string& metric
) {
    std::istringstream ss(body);
    std::string line;
    while (std::getline(ss, line)) {
        if (line.size() <= metric.size()
         || line.compare(0, metric.size(), metric) != 0
         || (line[metric.size()] != ' ' && line[metric.size()] != '{')
        ) {
            continue;
        }

        // name [{labels}] value [timestamp]
        std::size_t value_begin = metric.size();
        if (line[value_begin] == '{') {
            value_begin = line.find('}', value_begin);
            if (value_begin == std::string::npos) {
                return { false, 0 };
            }
            ++value_begin;
        }

        std::istringstream fields(line.substr(value_begin));
        std::string value_str;
        if (! (fields >> value_str)) {
            return { false, 0 };
        }

        try {
            const double value = std::stod(value_str);
            if (value < 0 || ! std::isfinite(value)) {
                return { false, 0 };
            }
            return { true, static_cast<std::uint64_t>(value) };
        } catch (const std::logic_error& e) {
            spdlog::warn("parse_height_metric: {}", e.what());
            return { false, 0 };
        }
    }

    return { false, 0 };
}

}

}
