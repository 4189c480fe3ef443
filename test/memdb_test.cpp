#define CATCH_CONFIG_MAIN

#include <string>
#include <vector>
#include <memory>

#include <catch2/catch.hpp>

#include <bx++/memdb.hpp>
#include <bx++/error.hpp>
#include "mock_node.hpp"


TEST_CASE( "uncommitted transaction leaves no trace", "[memdb]" ) {
    bx::memdb db;

    {
        std::unique_ptr<bx::store_txn> txn = db.begin();
        txn->insert_block(mock_node::make_block(0, 0, bx::blockhash()));

        bx::account alice("alice");
        alice.balance = 50;
        txn->put_account(alice);

        bx::sync_state sync;
        sync.indexed_height = 0;
        sync.tip_hash = mock_node::make_hash(0, 0);
        txn->put_sync_state(sync);

        bx::chain_totals totals;
        totals.blocks = 1;
        txn->put_totals(totals);

        bx::reorg_event event;
        event.height = 3;
        txn->insert_reorg_event(event);

        // dropped here
    }

    REQUIRE( db.blocks.empty() );
    REQUIRE( db.accounts.empty() );
    REQUIRE( db.reorg_events.empty() );
    REQUIRE( db.get_sync_state().empty() );
    REQUIRE( db.get_totals().blocks == 0 );
}

TEST_CASE( "committed transaction is visible to readers", "[memdb]" ) {
    bx::memdb db;

    {
        std::unique_ptr<bx::store_txn> txn = db.begin();
        txn->insert_block(mock_node::make_block(0, 0, bx::blockhash()));
        txn->insert_block(mock_node::make_block(1, 0, mock_node::make_hash(0, 0)));

        bx::account alice("alice");
        alice.balance = 50;
        txn->put_account(alice);
        txn->commit();
    }

    REQUIRE( db.get_block_hash(1) == std::optional<bx::blockhash>(mock_node::make_hash(1, 0)) );
    REQUIRE( ! db.get_block_hash(2).has_value() );
    REQUIRE( db.get_block(1)->txs.size() == 1 );
    REQUIRE( db.get_account("alice")->balance == 50 );
    REQUIRE( ! db.get_account("bob").has_value() );
}

TEST_CASE( "overwrites and deletes are undone", "[memdb]" ) {
    bx::memdb db;

    {
        std::unique_ptr<bx::store_txn> txn = db.begin();
        txn->insert_block(mock_node::make_block(0, 0, bx::blockhash()));
        bx::account alice("alice");
        alice.balance = 50;
        txn->put_account(alice);
        txn->commit();
    }

    {
        std::unique_ptr<bx::store_txn> txn = db.begin();
        txn->delete_block(0);
        bx::account alice("alice");
        alice.balance = 1;
        txn->put_account(alice);
        txn->put_account(bx::account("bob"));

        REQUIRE( ! txn->get_block(0).has_value() );
        REQUIRE( txn->get_account("alice")->balance == 1 );
    }

    REQUIRE( db.get_block(0).has_value() );
    REQUIRE( db.get_account("alice")->balance == 50 );
    REQUIRE( ! db.get_account("bob").has_value() );
}

TEST_CASE( "block height and hash are unique", "[memdb]" ) {
    bx::memdb db;
    std::unique_ptr<bx::store_txn> txn = db.begin();
    txn->insert_block(mock_node::make_block(0, 0, bx::blockhash()));

    REQUIRE_THROWS_AS( txn->insert_block(mock_node::make_block(0, 1, bx::blockhash())), bx::store_error );

    bx::block same_hash = mock_node::make_block(1, 0, mock_node::make_hash(0, 0));
    same_hash.hash = mock_node::make_hash(0, 0);
    REQUIRE_THROWS_AS( txn->insert_block(same_hash), bx::store_error );

    txn->insert_block(mock_node::make_block(1, 0, mock_node::make_hash(0, 0)));

    SECTION( "transaction hash already stored" ) {
        bx::block reused = mock_node::make_block(2, 0, mock_node::make_hash(1, 0));
        reused.txs.front().hash = mock_node::make_txhash(1, 0);
        REQUIRE_THROWS_AS( txn->insert_block(reused), bx::store_error );
        REQUIRE( ! txn->get_block(2).has_value() );
    }

    SECTION( "transaction hash repeated within the block" ) {
        bx::block repeated = mock_node::make_block(2, 0, mock_node::make_hash(1, 0));
        repeated.txs.push_back(repeated.txs.front());
        repeated.txs.back().tx_index = 1;
        repeated.tx_count = 2;
        REQUIRE_THROWS_AS( txn->insert_block(repeated), bx::store_error );
    }
}

TEST_CASE( "account history only looks below the given height", "[memdb]" ) {
    bx::memdb db;
    std::unique_ptr<bx::store_txn> txn = db.begin();

    bx::blockhash prev;
    for (std::uint64_t h=0; h<=5; ++h) {
        bx::block block = mock_node::make_block(h, 0, prev);
        if (h == 3) {
            block.txs[0].type = bx::tx_type::stake;
            block.txs[0].to_address.reset();
        }
        txn->insert_block(block);
        prev = block.hash;
    }

    const bx::account_history alice = txn->get_account_history("alice", 5);
    REQUIRE( alice.last_seen_height == std::optional<std::uint64_t>(4) );
    REQUIRE( alice.next_nonce == std::optional<std::uint64_t>(4) );
    REQUIRE( alice.is_validator );

    const bx::account_history early = txn->get_account_history("alice", 3);
    REQUIRE( early.last_seen_height == std::optional<std::uint64_t>(2) );
    REQUIRE( early.next_nonce == std::optional<std::uint64_t>(2) );
    REQUIRE( ! early.is_validator );

    const bx::account_history bob = txn->get_account_history("bob", 5);
    REQUIRE( bob.last_seen_height == std::optional<std::uint64_t>(4) );
    REQUIRE( ! bob.next_nonce.has_value() );

    const bx::account_history nobody = txn->get_account_history("carol", 5);
    REQUIRE( ! nobody.last_seen_height.has_value() );
}

TEST_CASE( "readers get blocks ascending and reorg events newest first", "[memdb]" ) {
    bx::memdb db;

    {
        std::unique_ptr<bx::store_txn> txn = db.begin();
        bx::blockhash prev;
        for (std::uint64_t h=0; h<=9; ++h) {
            const bx::block block = mock_node::make_block(h, 0, prev);
            txn->insert_block(block);
            prev = block.hash;
        }
        for (std::uint64_t i=1; i<=4; ++i) {
            bx::reorg_event event;
            event.height = i;
            event.detected_at = static_cast<std::int64_t>(i);
            txn->insert_reorg_event(event);
        }
        txn->commit();
    }

    const std::vector<bx::block> recent = db.get_blocks_since(mock_node::base_time + 30);
    REQUIRE( recent.size() == 4 );
    REQUIRE( recent.front().height == 6 );
    REQUIRE( recent.back().height == 9 );

    const std::vector<bx::reorg_event> events = db.get_reorg_events(3);
    REQUIRE( events.size() == 3 );
    REQUIRE( events[0].height == 4 );
    REQUIRE( events[2].height == 2 );
}
