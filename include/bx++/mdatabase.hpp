#ifndef BX_MDATABASE_HPP
#define BX_MDATABASE_HPP

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <cstdint>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/client_session.hpp>
#include <mongocxx/uri.hpp>
#include <mongocxx/pool.hpp>
#include <mongocxx/instance.hpp>
#include <bx++/store.hpp>

namespace bx {

// mongodb backed store
// collections: blocks, transactions, accounts, sync_state, totals, reorg_events
// multi document writes go through client sessions, which requires a
// replica set (a single node replica set is fine)
struct mdatabase : public bx::store
{
    mongocxx::instance inst{};
    mongocxx::pool pool{mongocxx::uri{}};
    const std::string db_name;

    mdatabase(
        const std::string& db_name,
        const std::string& uri
    )
    : inst{}
    , pool{uri.empty() ? mongocxx::uri{} : mongocxx::uri{uri}}
    , db_name(db_name)
    {}

    // unique indexes on block height/hash, tx hash and account address
    void create_indexes();

    std::unique_ptr<bx::store_txn> begin() override;

    bx::sync_state get_sync_state() override;
    bx::chain_totals get_totals() override;

    std::optional<bx::blockhash> get_block_hash(const std::uint64_t height) override;
    std::optional<bx::block> get_block(const std::uint64_t height) override;
    std::optional<bx::account> get_account(const std::string& address) override;

    // transactions are not loaded, tx_count is
    std::vector<bx::block> get_blocks_since(const std::int64_t since) override;

    std::vector<bx::reorg_event> get_reorg_events(const std::size_t limit) override;
};

struct mdatabase_txn : public bx::store_txn
{
    const std::string       db_name;
    mongocxx::pool::entry   client;  // must outlive session
    mongocxx::client_session session;

    mdatabase_txn(
        mongocxx::pool&    pool,
        const std::string& db_name
    );

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
};

}

#endif
