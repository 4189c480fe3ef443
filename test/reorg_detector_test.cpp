#define CATCH_CONFIG_MAIN

#include <memory>

#include <catch2/catch.hpp>

#include <bx++/memdb.hpp>
#include <bx++/reorg_detector.hpp>
#include "mock_node.hpp"


// copies the node's current chain into the store as our replica
void replicate(bx::memdb & db, mock_node & node)
{
    std::unique_ptr<bx::store_txn> txn = db.begin();
    bx::sync_state sync;
    for (const auto & m : node.chain) {
        txn->insert_block(m.second);
        sync.indexed_height = static_cast<std::int64_t>(m.first);
        sync.tip_hash = m.second.hash;
    }
    txn->put_sync_state(sync);
    txn->commit();
}

TEST_CASE( "matching chains report no divergence", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    bx::reorg_detector detector(node, db, 5, 0);
    REQUIRE( detector.find_divergence(10).status == bx::reorg_status::NONE );

    SECTION( "nothing indexed yet" ) {
        bx::memdb empty;
        bx::reorg_detector fresh(node, empty, 5, 0);
        REQUIRE( fresh.find_divergence(-1).status == bx::reorg_status::NONE );
    }
}

TEST_CASE( "earliest divergence inside the window wins", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.fork_at(7, 1, 12);

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::DIVERGED );
    REQUIRE( d.height == 7 );
    REQUIRE( d.old_hash == mock_node::make_hash(7, 0) );
    REQUIRE( d.new_hash == mock_node::make_hash(7, 1) );
}

TEST_CASE( "divergence at the bottom of the window that links below is in range", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.fork_at(6, 1, 10);

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::DIVERGED );
    REQUIRE( d.height == 6 );
}

TEST_CASE( "fork below the window is beyond lookback", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.fork_at(4, 1, 10);

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::BEYOND_LOOKBACK );
    REQUIRE( d.height == 6 );
}

TEST_CASE( "window reaching genesis never reports beyond lookback", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(3);
    replicate(db, node);

    node.fork_at(0, 1, 3);

    bx::reorg_detector detector(node, db, 10, 0);
    const bx::divergence d = detector.find_divergence(3);

    REQUIRE( d.status == bx::reorg_status::DIVERGED );
    REQUIRE( d.height == 0 );
}

TEST_CASE( "node failure mid-scan concludes nothing", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.unavailable_heights.insert(8);

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::UNAVAILABLE );
    REQUIRE( d.height == 8 );
}

TEST_CASE( "node answering with another height concludes nothing", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.serve_at(8, node.chain.at(9));

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::UNAVAILABLE );
    REQUIRE( d.height == 8 );
}

TEST_CASE( "advertised height disappearing is missing", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(10);
    replicate(db, node);

    node.truncate(8);

    bx::reorg_detector detector(node, db, 5, 0);
    const bx::divergence d = detector.find_divergence(10);

    REQUIRE( d.status == bx::reorg_status::MISSING );
    REQUIRE( d.height == 9 );
}

TEST_CASE( "verify_range covers heights below the lookback", "[reorg_detector]" ) {
    bx::memdb db;
    mock_node node;
    node.extend(20);
    replicate(db, node);

    node.fork_at(3, 1, 20);

    bx::reorg_detector detector(node, db, 5, 0);
    REQUIRE( detector.find_divergence(20).status == bx::reorg_status::BEYOND_LOOKBACK );

    const bx::divergence d = detector.verify_range(0, 1000);
    REQUIRE( d.status == bx::reorg_status::DIVERGED );
    REQUIRE( d.height == 3 );

    SECTION( "ranges past the stored tip are clamped" ) {
        mock_node longer;
        longer.extend(30);
        bx::reorg_detector clamped(longer, db, 5, 0);
        REQUIRE( clamped.verify_range(15, 30).status == bx::reorg_status::NONE );
    }
}
