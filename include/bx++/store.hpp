#ifndef BX_STORE_HPP
#define BX_STORE_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>

#include <bx++/bhash.hpp>
#include <bx++/block.hpp>
#include <bx++/account.hpp>
#include <bx++/sync_state.hpp>

namespace bx {

// one atomic unit of work against the store
// nothing is visible to readers until commit() returns, destroying an
// uncommitted store_txn discards every write made through it
// all methods may throw bx::store_error
struct store_txn
{
    virtual ~store_txn() = default;

    virtual bx::sync_state get_sync_state() = 0;
    virtual void put_sync_state(const bx::sync_state& state) = 0;

    virtual bx::chain_totals get_totals() = 0;
    virtual void put_totals(const bx::chain_totals& totals) = 0;

    // block including its transactions
    virtual std::optional<bx::block> get_block(const std::uint64_t height) = 0;
    virtual void insert_block(const bx::block& block) = 0;
    virtual void delete_block(const std::uint64_t height) = 0;

    virtual std::optional<bx::account> get_account(const std::string& address) = 0;
    virtual void put_account(const bx::account& acc) = 0;

    // activity of address in blocks strictly below height
    virtual bx::account_history get_account_history(
        const std::string&  address,
        const std::uint64_t below_height
    ) = 0;

    virtual void insert_reorg_event(const bx::reorg_event& event) = 0;

    virtual void commit() = 0;
};

// persistent replica of the chain
// the indexer is the only writer, everything else only reads
struct store
{
    virtual ~store() = default;

    virtual std::unique_ptr<bx::store_txn> begin() = 0;

    virtual bx::sync_state get_sync_state() = 0;
    virtual bx::chain_totals get_totals() = 0;

    virtual std::optional<bx::blockhash> get_block_hash(const std::uint64_t height) = 0;
    virtual std::optional<bx::block> get_block(const std::uint64_t height) = 0;
    virtual std::optional<bx::account> get_account(const std::string& address) = 0;

    // blocks with timestamp >= since, ascending by height
    virtual std::vector<bx::block> get_blocks_since(const std::int64_t since) = 0;

    // most recent first
    virtual std::vector<bx::reorg_event> get_reorg_events(const std::size_t limit) = 0;
};

}

#endif
