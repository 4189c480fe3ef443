#define CATCH_CONFIG_MAIN

#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include <bx++/amount.hpp>
#include <bx++/account.hpp>
#include <bx++/block.hpp>
#include <bx++/transaction.hpp>
#include <bx++/aggregator.hpp>
#include <bx++/error.hpp>


bx::transaction make_tx(
    const bx::tx_type   type,
    const std::string&  from,
    const std::string&  to,
    const int           value,
    const int           fee,
    const std::uint64_t nonce
) {
    bx::transaction tx;
    tx.type         = type;
    tx.from_address = from;
    if (! to.empty()) {
        tx.to_address = to;
    }
    tx.value = value;
    tx.fee   = fee;
    tx.nonce = nonce;
    return tx;
}

bx::block make_block(const std::uint64_t height, const std::vector<bx::transaction>& txs)
{
    bx::block block;
    block.height    = height;
    block.timestamp = 1000 + static_cast<std::int64_t>(height);
    block.txs       = txs;
    block.tx_count  = static_cast<std::uint32_t>(txs.size());
    return block;
}

bx::block make_timed_block(const std::uint64_t height, const std::int64_t timestamp, const std::uint32_t tx_count)
{
    bx::block block;
    block.height    = height;
    block.timestamp = timestamp;
    block.tx_count  = tx_count;
    return block;
}

bx::amount conservation_sum(const bx::block_effects& effects)
{
    bx::amount sum = effects.fees + effects.bonded;
    for (const auto & m : effects.accounts) {
        sum += m.second.balance;
    }
    return sum;
}

const std::vector<bx::transaction> mixed_txs = {
    make_tx(bx::tx_type::transfer,         "alice", "bob",   100, 3, 0),
    make_tx(bx::tx_type::stake,            "alice", "",      500, 1, 1),
    make_tx(bx::tx_type::delegate,         "bob",   "alice",  20, 1, 0),
    make_tx(bx::tx_type::undelegate,       "bob",   "",        5, 1, 1),
    make_tx(bx::tx_type::compute,          "carol", "bob",    40, 2, 0),
    make_tx(bx::tx_type::submit_result,    "bob",   "carol",   8, 1, 2),
    make_tx(bx::tx_type::update_validator, "alice", "",       99, 1, 2),
    make_tx(bx::tx_type::unjail,           "alice", "",        0, 4, 3),
    make_tx(bx::tx_type::unstake,          "alice", "",      200, 1, 4),
};


TEST_CASE( "deltas conserve value", "[aggregator]" ) {
    const bx::block_effects effects = bx::aggregator::apply_block(make_block(7, mixed_txs));

    REQUIRE( conservation_sum(effects) == 0 );
    REQUIRE( effects.fees == 15 );
    REQUIRE( effects.bonded == 500 + 20 - 5 - 200 );
    REQUIRE( effects.transferred == 100 );
    REQUIRE( effects.blocks == 1 );
    REQUIRE( effects.transactions == 9 );

    const bx::block_effects reverted = bx::aggregator::revert_block(make_block(7, mixed_txs));
    REQUIRE( conservation_sum(reverted) == 0 );
}

TEST_CASE( "fees go to the fee sink", "[aggregator]" ) {
    const bx::block_effects effects = bx::aggregator::apply_block(make_block(1, {
        make_tx(bx::tx_type::transfer, "alice", "bob", 10, 2, 0),
    }));

    REQUIRE( effects.accounts.at("alice").balance == -12 );
    REQUIRE( effects.accounts.at("bob").balance == 10 );
    REQUIRE( effects.fees == 2 );
}

TEST_CASE( "value without a recipient stays with the sender", "[aggregator]" ) {
    const bx::block_effects effects = bx::aggregator::apply_block(make_block(1, {
        make_tx(bx::tx_type::compute, "alice", "", 50, 3, 0),
    }));

    REQUIRE( effects.accounts.size() == 1 );
    REQUIRE( effects.accounts.at("alice").balance == -3 );
    REQUIRE( effects.accounts.at("alice").tx_received_count == 0 );
    REQUIRE( conservation_sum(effects) == 0 );
}

TEST_CASE( "self transfer counts once", "[aggregator]" ) {
    const bx::block_effects effects = bx::aggregator::apply_block(make_block(4, {
        make_tx(bx::tx_type::transfer, "alice", "alice", 10, 1, 0),
    }));

    const bx::account_delta & d = effects.accounts.at("alice");
    REQUIRE( d.balance == -1 );
    REQUIRE( d.tx_count == 1 );
    REQUIRE( d.tx_sent_count == 1 );
    REQUIRE( d.tx_received_count == 1 );
}

TEST_CASE( "stake marks validator and bonds value", "[aggregator]" ) {
    bx::account alice("alice");
    alice.balance = 1000;

    const bx::block_effects effects = bx::aggregator::apply_block(make_block(3, {
        make_tx(bx::tx_type::stake, "alice", "", 400, 1, 0),
    }));

    const bx::account staked = bx::aggregator::apply_delta(alice, effects.accounts.at("alice"), {});
    REQUIRE( staked.balance == 599 );
    REQUIRE( staked.is_validator );
    REQUIRE( staked.nonce == 1 );
    REQUIRE( staked.first_seen_height == std::optional<std::uint64_t>(3) );
    REQUIRE( effects.bonded == 400 );

    SECTION( "unstake returns bonded value" ) {
        const bx::block_effects unstake = bx::aggregator::apply_block(make_block(4, {
            make_tx(bx::tx_type::unstake, "alice", "", 400, 1, 1),
        }));

        const bx::account unstaked = bx::aggregator::apply_delta(staked, unstake.accounts.at("alice"), {});
        REQUIRE( unstaked.balance == 998 );
        REQUIRE( unstake.bonded == -400 );
        REQUIRE( unstaked.nonce == 2 );
        REQUIRE( unstaked.last_seen_height == std::optional<std::uint64_t>(4) );
    }
}

TEST_CASE( "apply then revert nets to zero", "[aggregator]" ) {
    const bx::block block = make_block(12, mixed_txs);
    const bx::block_effects applied  = bx::aggregator::apply_block(block);
    const bx::block_effects reverted = bx::aggregator::revert_block(block);

    REQUIRE( applied.accounts.size() == reverted.accounts.size() );

    for (const auto & m : applied.accounts) {
        bx::account before(m.first);
        before.balance           = 10000;
        before.nonce             = 7;
        before.tx_count          = 5;
        before.tx_sent_count     = 4;
        before.tx_received_count = 1;
        before.first_seen_height = 2;
        before.last_seen_height  = 9;

        // what the store reports for heights below 12
        bx::account_history history;
        history.last_seen_height = 9;
        history.next_nonce       = 7;
        history.is_validator     = false;

        const bx::account after    = bx::aggregator::apply_delta(before, m.second, {});
        const bx::account restored = bx::aggregator::apply_delta(after, reverted.accounts.at(m.first), history);

        REQUIRE( restored.balance           == before.balance );
        REQUIRE( restored.nonce             == before.nonce );
        REQUIRE( restored.tx_count          == before.tx_count );
        REQUIRE( restored.tx_sent_count     == before.tx_sent_count );
        REQUIRE( restored.tx_received_count == before.tx_received_count );
        REQUIRE( restored.first_seen_height == before.first_seen_height );
        REQUIRE( restored.last_seen_height  == before.last_seen_height );
        REQUIRE( restored.is_validator      == before.is_validator );
    }

    bx::chain_totals totals;
    totals.blocks       = 12;
    totals.transactions = 40;
    totals.fees         = 1000;
    totals.bonded       = 5000;

    bx::chain_totals roundtrip = totals;
    bx::aggregator::apply_totals(roundtrip, applied);
    bx::aggregator::apply_totals(roundtrip, reverted);
    REQUIRE( roundtrip.blocks       == totals.blocks );
    REQUIRE( roundtrip.transactions == totals.transactions );
    REQUIRE( roundtrip.fees         == totals.fees );
    REQUIRE( roundtrip.bonded       == totals.bonded );
    REQUIRE( roundtrip.transferred  == totals.transferred );
}

TEST_CASE( "revert of an account's only block clears first and last seen", "[aggregator]" ) {
    const bx::block block = make_block(5, {
        make_tx(bx::tx_type::transfer, "alice", "dave", 1, 1, 0),
    });

    const bx::account dave = bx::aggregator::apply_delta(
        bx::account("dave"), bx::aggregator::apply_block(block).accounts.at("dave"), {}
    );
    REQUIRE( dave.first_seen_height == std::optional<std::uint64_t>(5) );

    const bx::account gone = bx::aggregator::apply_delta(
        dave, bx::aggregator::revert_block(block).accounts.at("dave"), {}
    );
    REQUIRE( gone.balance == 0 );
    REQUIRE( gone.tx_count == 0 );
    REQUIRE( ! gone.first_seen_height.has_value() );
    REQUIRE( ! gone.last_seen_height.has_value() );
}

TEST_CASE( "counters never go negative", "[aggregator]" ) {
    const bx::block block = make_block(5, {
        make_tx(bx::tx_type::transfer, "alice", "bob", 1, 1, 0),
    });

    const bx::block_effects reverted = bx::aggregator::revert_block(block);
    REQUIRE_THROWS_AS(
        bx::aggregator::apply_delta(bx::account("alice"), reverted.accounts.at("alice"), {}),
        bx::integrity_fault
    );

    bx::chain_totals empty;
    REQUIRE_THROWS_AS( bx::aggregator::apply_totals(empty, reverted), bx::integrity_fault );
}

TEST_CASE( "amounts are exact beyond 64 bits", "[aggregator]" ) {
    const std::pair<bool, bx::amount> big = bx::parse_amount("123456789012345678901234567890");
    REQUIRE( big.first );

    bx::transaction tx = make_tx(bx::tx_type::transfer, "alice", "bob", 0, 1, 0);
    tx.value = big.second;

    bx::account alice("alice");
    alice.balance = big.second * 2;

    const bx::block_effects effects = bx::aggregator::apply_block(make_block(1, { tx }));
    const bx::account after = bx::aggregator::apply_delta(alice, effects.accounts.at("alice"), {});

    REQUIRE( bx::to_string(after.balance) == "123456789012345678901234567889" );
}

TEST_CASE( "throughput of an empty window is zero", "[aggregator][throughput]" ) {
    const bx::throughput t = bx::aggregator::update_throughput_window({}, 5000);

    REQUIRE( t.current_tps == 0 );
    REQUIRE( t.avg_tps_1h == 0 );
    REQUIRE( t.avg_block_time == 0 );
    REQUIRE( t.blocks_in_window == 0 );
    REQUIRE( t.txs_in_window == 0 );

    SECTION( "a single block still has no rate" ) {
        const bx::throughput one = bx::aggregator::update_throughput_window({ make_timed_block(1, 4990, 12) }, 5000);
        REQUIRE( one.blocks_in_window == 1 );
        REQUIRE( one.txs_in_window == 12 );
        REQUIRE( one.avg_tps_1h == 0 );
        REQUIRE( one.current_tps == 0 );
    }
}

TEST_CASE( "throughput window is bounded in time", "[aggregator][throughput]" ) {
    const std::int64_t now = 10000;
    const std::vector<bx::block> blocks = {
        make_timed_block(1, now - 7200, 1000), // too old
        make_timed_block(2, now - 100,  10),
        make_timed_block(3, now - 50,   20),
        make_timed_block(4, now,        30),
        make_timed_block(5, now + 60,   1000), // clock skew, not yet
    };

    const bx::throughput t = bx::aggregator::update_throughput_window(blocks, now, 3600);

    REQUIRE( t.blocks_in_window == 3 );
    REQUIRE( t.txs_in_window == 60 );
    REQUIRE( t.avg_tps_1h == Approx(60.0 / 100.0) );
    REQUIRE( t.avg_block_time == Approx(50.0) );
    REQUIRE( t.current_tps == Approx(60.0 / 100.0) );
}

TEST_CASE( "current tps only looks at the most recent blocks", "[aggregator][throughput]" ) {
    std::vector<bx::block> blocks;
    for (std::uint64_t h=0; h<20; ++h) {
        // slow first half, busy second half
        blocks.push_back(make_timed_block(h, 1000 + static_cast<std::int64_t>(h) * 10, h < 10 ? 1 : 100));
    }

    const bx::throughput t = bx::aggregator::update_throughput_window(blocks, 1190, 3600);

    REQUIRE( t.blocks_in_window == 20 );
    REQUIRE( t.current_tps == Approx(1000.0 / 90.0) );
    REQUIRE( t.avg_tps_1h == Approx(1010.0 / 190.0) );
}
