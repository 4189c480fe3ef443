#ifndef BX_MEMDB_HPP
#define BX_MEMDB_HPP

#include <map>
#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <functional>
#include <boost/thread.hpp>
#include <absl/container/flat_hash_map.h>
#include <bx++/store.hpp>

namespace bx {

// in process store, used by the tests and for ephemeral runs
// a write transaction holds lookup_mtx exclusively until it commits or is
// dropped, readers therefore never see a partially applied transaction
struct memdb : public bx::store
{
    boost::shared_mutex lookup_mtx; // IMPORTANT: lookups/inserts must be guarded with the lookup_mtx

    std::map<std::uint64_t, bx::block>             blocks;
    absl::flat_hash_map<std::string, bx::account>  accounts;
    bx::sync_state                                 sync;
    bx::chain_totals                               totals;
    std::vector<bx::reorg_event>                   reorg_events;

    memdb() = default;

    std::unique_ptr<bx::store_txn> begin() override;

    bx::sync_state get_sync_state() override;
    bx::chain_totals get_totals() override;

    std::optional<bx::blockhash> get_block_hash(const std::uint64_t height) override;
    std::optional<bx::block> get_block(const std::uint64_t height) override;
    std::optional<bx::account> get_account(const std::string& address) override;
    std::vector<bx::block> get_blocks_since(const std::int64_t since) override;
    std::vector<bx::reorg_event> get_reorg_events(const std::size_t limit) override;

    std::vector<bx::account> get_all_accounts();
};

struct memdb_txn : public bx::store_txn
{
    bx::memdb & db;
    boost::unique_lock<boost::shared_mutex> lock;
    std::vector<std::function<void()>> undo_log;
    bool committed;

    explicit memdb_txn(bx::memdb & db);
    ~memdb_txn() override;

    bx::sync_state get_sync_state() override;
    void put_sync_state(const bx::sync_state& state) override;

    bx::chain_totals get_totals() override;
    void put_totals(const bx::chain_totals& totals) override;

    std::optional<bx::block> get_block(const std::uint64_t height) override;
    void insert_block(const bx::block& block) override;
    void delete_block(const std::uint64_t height) override;

    std::optional<bx::account> get_account(const std::string& address) override;
    void put_account(const bx::account& acc) override;

    bx::account_history get_account_history(
        const std::string&  address,
        const std::uint64_t below_height
    ) override;

    void insert_reorg_event(const bx::reorg_event& event) override;

    void commit() override;

private:
    void rollback();
};

}

#endif
