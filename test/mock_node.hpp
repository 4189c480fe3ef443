#ifndef BX_TEST_MOCK_NODE_HPP
#define BX_TEST_MOCK_NODE_HPP

#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <thread>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <bx++/bhash.hpp>
#include <bx++/block.hpp>
#include <bx++/transaction.hpp>
#include <bx++/node_client.hpp>

// scripted chain for driving the indexer without a network
// blocks at height h > 0 carry one tx from alice:
//   branch 0: 10 to bob, fee 1
//   branch n: 7 to carol, fee 2
struct mock_node : public bx::node_client
{
    static constexpr std::int64_t base_time = 1700000000;

    std::mutex mtx;
    std::map<std::uint64_t, bx::block> chain;
    std::set<std::uint64_t> unavailable_heights;
    std::set<std::uint64_t> missing_heights;
    bool available { true };
    std::chrono::milliseconds delay { 0 };
    std::atomic<int> calls { 0 };

    static bx::blockhash make_hash(const std::uint64_t height, const std::uint8_t branch)
    {
        bx::blockhash ret;
        for (int i=0; i<8; ++i) {
            ret.v[i] = static_cast<std::uint8_t>(height >> (56 - 8*i));
        }
        ret.v[8]  = branch;
        ret.v[31] = 0xbb;
        return ret;
    }

    static bx::txhash make_txhash(const std::uint64_t height, const std::uint8_t branch)
    {
        bx::txhash ret;
        for (int i=0; i<8; ++i) {
            ret.v[i] = static_cast<std::uint8_t>(height >> (56 - 8*i));
        }
        ret.v[8]  = branch;
        ret.v[31] = 0x77;
        return ret;
    }

    static bx::block make_block(
        const std::uint64_t  height,
        const std::uint8_t   branch,
        const bx::blockhash& prev_hash
    ) {
        bx::block block;
        block.height    = height;
        block.hash      = make_hash(height, branch);
        block.prev_hash = prev_hash;
        block.timestamp = base_time + static_cast<std::int64_t>(height) * 5;
        block.chain_id  = "computechain-test";
        block.proposer_address = "validator0";

        if (height > 0) {
            bx::transaction tx;
            tx.hash         = make_txhash(height, branch);
            tx.block_height = height;
            tx.tx_index     = 0;
            tx.type         = bx::tx_type::transfer;
            tx.from_address = "alice";
            tx.to_address   = branch == 0 ? "bob" : "carol";
            tx.value        = branch == 0 ? 10 : 7;
            tx.fee          = branch == 0 ? 1 : 2;
            tx.nonce        = height - 1;
            block.txs.push_back(tx);
        }

        block.tx_count = static_cast<std::uint32_t>(block.txs.size());
        return block;
    }

    // appends blocks until the tip is at `tip`
    void extend(const std::uint64_t tip, const std::uint8_t branch = 0)
    {
        std::lock_guard<std::mutex> lock(mtx);
        std::uint64_t h = chain.empty() ? 0 : chain.rbegin()->first + 1;
        for (; h<=tip; ++h) {
            const bx::blockhash prev = h == 0 ? bx::blockhash() : chain.at(h - 1).hash;
            chain[h] = make_block(h, branch, prev);
        }
    }

    // replaces everything from `height` upward with a branch ending at `tip`
    void fork_at(
        const std::uint64_t height,
        const std::uint8_t  branch,
        const std::uint64_t tip
    ) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            chain.erase(chain.lower_bound(height), chain.end());
        }
        extend(tip, branch);
    }

    void put(const bx::block& block)
    {
        std::lock_guard<std::mutex> lock(mtx);
        chain[block.height] = block;
    }

    // answers requests for `height` with `block`, whatever height it carries
    void serve_at(const std::uint64_t height, const bx::block& block)
    {
        std::lock_guard<std::mutex> lock(mtx);
        chain[height] = block;
    }

    void truncate(const std::uint64_t tip)
    {
        std::lock_guard<std::mutex> lock(mtx);
        chain.erase(chain.upper_bound(tip), chain.end());
    }

    std::pair<bx::node_status, std::uint64_t> current_height() override
    {
        ++calls;
        std::lock_guard<std::mutex> lock(mtx);
        if (! available) {
            return { bx::node_status::UNAVAILABLE, 0 };
        }
        if (chain.empty()) {
            return { bx::node_status::NOT_FOUND, 0 };
        }

        return { bx::node_status::OK, chain.rbegin()->first };
    }

    std::pair<bx::node_status, bx::block> get_block(const std::uint64_t height) override
    {
        ++calls;
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        std::lock_guard<std::mutex> lock(mtx);
        if (! available || unavailable_heights.count(height)) {
            return { bx::node_status::UNAVAILABLE, {} };
        }

        const auto search = chain.find(height);
        if (search == chain.end() || missing_heights.count(height)) {
            return { bx::node_status::NOT_FOUND, {} };
        }

        return { bx::node_status::OK, search->second };
    }

    std::pair<bx::node_status, bx::block> get_block(const bx::blockhash& hash) override
    {
        ++calls;
        std::lock_guard<std::mutex> lock(mtx);
        if (! available) {
            return { bx::node_status::UNAVAILABLE, {} };
        }

        for (const auto & m : chain) {
            if (m.second.hash == hash) {
                return { bx::node_status::OK, m.second };
            }
        }

        return { bx::node_status::NOT_FOUND, {} };
    }
};

#endif
