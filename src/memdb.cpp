#include <algorithm>
#include <vector>
#include <string>
#include <boost/thread.hpp>
#include <absl/container/flat_hash_set.h>
#include <spdlog/spdlog.h>
#include <bx++/error.hpp>
#include <bx++/memdb.hpp>

namespace bx {

std::unique_ptr<bx::store_txn> memdb::begin()
{
    return std::make_unique<bx::memdb_txn>(*this);
}

bx::sync_state memdb::get_sync_state()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);
    return sync;
}

bx::chain_totals memdb::get_totals()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);
    return totals;
}

std::optional<bx::blockhash> memdb::get_block_hash(const std::uint64_t height)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    const auto search = blocks.find(height);
    if (search == blocks.end()) {
        return std::nullopt;
    }

    return search->second.hash;
}

std::optional<bx::block> memdb::get_block(const std::uint64_t height)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    const auto search = blocks.find(height);
    if (search == blocks.end()) {
        return std::nullopt;
    }

    return search->second;
}

std::optional<bx::account> memdb::get_account(const std::string& address)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    const auto search = accounts.find(address);
    if (search == accounts.end()) {
        return std::nullopt;
    }

    return search->second;
}

std::vector<bx::block> memdb::get_blocks_since(const std::int64_t since)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    std::vector<bx::block> ret;
    for (const auto & m : blocks) {
        if (m.second.timestamp >= since) {
            ret.push_back(m.second);
        }
    }

    return ret;
}

std::vector<bx::reorg_event> memdb::get_reorg_events(const std::size_t limit)
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    std::vector<bx::reorg_event> ret;
    for (auto it = reorg_events.rbegin(); it != reorg_events.rend() && ret.size() < limit; ++it) {
        ret.push_back(*it);
    }

    return ret;
}

std::vector<bx::account> memdb::get_all_accounts()
{
    boost::shared_lock<boost::shared_mutex> lock(lookup_mtx);

    std::vector<bx::account> ret;
    ret.reserve(accounts.size());
    for (const auto & m : accounts) {
        ret.push_back(m.second);
    }

    std::sort(ret.begin(), ret.end(), [](const bx::account& a, const bx::account& b) {
        return a.address < b.address;
    });

    return ret;
}


memdb_txn::memdb_txn(bx::memdb & db)
: db(db)
, lock(db.lookup_mtx)
, committed(false)
{}

memdb_txn::~memdb_txn()
{
    if (! committed) {
        rollback();
    }
}

void memdb_txn::rollback()
{
    for (auto it = undo_log.rbegin(); it != undo_log.rend(); ++it) {
        (*it)();
    }

    undo_log.clear();
}

bx::sync_state memdb_txn::get_sync_state()
{
    return db.sync;
}

void memdb_txn::put_sync_state(const bx::sync_state& state)
{
    undo_log.emplace_back([this, prev = db.sync] {
        db.sync = prev;
    });

    db.sync = state;
}

bx::chain_totals memdb_txn::get_totals()
{
    return db.totals;
}

void memdb_txn::put_totals(const bx::chain_totals& totals)
{
    undo_log.emplace_back([this, prev = db.totals] {
        db.totals = prev;
    });

    db.totals = totals;
}

std::optional<bx::block> memdb_txn::get_block(const std::uint64_t height)
{
    const auto search = db.blocks.find(height);
    if (search == db.blocks.end()) {
        return std::nullopt;
    }

    return search->second;
}

void memdb_txn::insert_block(const bx::block& block)
{
    if (db.blocks.count(block.height) != 0) {
        throw bx::store_error("duplicate block height " + std::to_string(block.height));
    }

    absl::flat_hash_set<bx::txhash> txhashes;
    for (const bx::transaction & tx : block.txs) {
        if (! txhashes.insert(tx.hash).second) {
            throw bx::store_error("duplicate transaction hash " + tx.hash.decompress());
        }
    }

    for (const auto & m : db.blocks) {
        if (m.second.hash == block.hash) {
            throw bx::store_error("duplicate block hash " + block.hash.decompress());
        }
        for (const bx::transaction & tx : m.second.txs) {
            if (txhashes.count(tx.hash) != 0) {
                throw bx::store_error("duplicate transaction hash " + tx.hash.decompress());
            }
        }
    }

    db.blocks.emplace(block.height, block);
    undo_log.emplace_back([this, height = block.height] {
        db.blocks.erase(height);
    });
}

void memdb_txn::delete_block(const std::uint64_t height)
{
    const auto search = db.blocks.find(height);
    if (search == db.blocks.end()) {
        return;
    }

    undo_log.emplace_back([this, prev = search->second] {
        db.blocks.emplace(prev.height, prev);
    });

    db.blocks.erase(search);
}

std::optional<bx::account> memdb_txn::get_account(const std::string& address)
{
    const auto search = db.accounts.find(address);
    if (search == db.accounts.end()) {
        return std::nullopt;
    }

    return search->second;
}

void memdb_txn::put_account(const bx::account& acc)
{
    const auto search = db.accounts.find(acc.address);
    if (search == db.accounts.end()) {
        undo_log.emplace_back([this, address = acc.address] {
            db.accounts.erase(address);
        });
    } else {
        undo_log.emplace_back([this, prev = search->second] {
            db.accounts[prev.address] = prev;
        });
    }

    db.accounts[acc.address] = acc;
}

bx::account_history memdb_txn::get_account_history(
    const std::string&  address,
    const std::uint64_t below_height
) {
    bx::account_history ret;

    for (auto it = db.blocks.begin(); it != db.blocks.end() && it->first < below_height; ++it) {
        for (const bx::transaction & tx : it->second.txs) {
            const bool sent     = tx.from_address == address;
            const bool received = tx.has_recipient() && *tx.to_address == address;

            if (sent || received) {
                ret.last_seen_height = it->first;
            }
            if (sent) {
                ret.next_nonce = std::max(ret.next_nonce.value_or(0), tx.nonce + 1);
                if (tx.type == bx::tx_type::stake) {
                    ret.is_validator = true;
                }
            }
        }
    }

    return ret;
}

void memdb_txn::insert_reorg_event(const bx::reorg_event& event)
{
    db.reorg_events.push_back(event);
    undo_log.emplace_back([this] {
        db.reorg_events.pop_back();
    });
}

void memdb_txn::commit()
{
    if (committed) {
        throw bx::store_error("transaction already committed");
    }

    committed = true;
    undo_log.clear();
    lock.unlock();
}

}
