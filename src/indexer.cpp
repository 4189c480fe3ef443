#include <algorithm>
#include <string>
#include <vector>
#include <boost/thread.hpp>
#include <spdlog/spdlog.h>
#include <bx++/util.hpp>
#include <bx++/indexer.hpp>

namespace bx {

std::string to_string(const bx::indexer_state state)
{
    switch (state) {
        case bx::indexer_state::CATCHING_UP:  return "catching_up";
        case bx::indexer_state::SYNCED:       return "synced";
        case bx::indexer_state::REORG_CHECK:  return "reorg_check";
        case bx::indexer_state::ROLLING_BACK: return "rolling_back";
        case bx::indexer_state::HALTED:       return "halted";
    }

    return "unknown";
}

namespace {

// exclusive hold of processing_mutex for one phase
// counts the times a phase had to wait for another to finish
struct writer_guard
{
    bx::indexer & idx;
    boost::unique_lock<boost::shared_mutex> lock;

    explicit writer_guard(bx::indexer & idx)
    : idx(idx)
    , lock(idx.processing_mutex, boost::try_to_lock)
    {
        if (! lock.owns_lock()) {
            ++idx.contended;
            lock.lock();
        }

        ++idx.acquisitions;

        const int active = ++idx.active_writers;
        int prev = idx.max_concurrent_writers.load();
        while (active > prev && ! idx.max_concurrent_writers.compare_exchange_weak(prev, active)) {}
    }

    ~writer_guard()
    {
        --idx.active_writers;
    }
};

}

indexer::indexer(
    bx::node_client &         node,
    bx::store &               db,
    const bx::indexer_config& cfg
)
: node(node)
, db(db)
, cfg(cfg)
, detector(node, db, cfg.resync_depth, cfg.genesis_height)
, clock(bx::util::current_time)
{}

indexer::~indexer()
{
    stop();
}

bool indexer::has_tip(const bx::sync_state& sync) const
{
    return sync.indexed_height >= static_cast<std::int64_t>(cfg.genesis_height);
}

std::uint64_t indexer::next_height(const bx::sync_state& sync) const
{
    return has_tip(sync)
        ? static_cast<std::uint64_t>(sync.indexed_height) + 1
        : cfg.genesis_height;
}

void indexer::seed_genesis(const std::vector<bx::genesis_allocation>& allocations)
{
    writer_guard guard(*this);

    std::unique_ptr<bx::store_txn> txn = db.begin();
    std::size_t seeded = 0;
    for (const bx::genesis_allocation & alloc : allocations) {
        if (txn->get_account(alloc.address)) {
            continue;
        }

        bx::account acc(alloc.address);
        acc.balance = alloc.balance;
        txn->put_account(acc);
        ++seeded;
    }
    txn->commit();

    spdlog::info("indexer: seeded {} of {} genesis allocations", seeded, allocations.size());
}

std::size_t indexer::poll_tick()
{
    if (state == bx::indexer_state::HALTED) {
        return 0;
    }

    writer_guard guard(*this);
    if (state == bx::indexer_state::HALTED) {
        return 0;
    }

    const std::pair<bx::node_status, std::uint64_t> head = node.current_height();
    if (head.first != bx::node_status::OK) {
        register_node_failure("current_height", head.first);
        return 0;
    }
    node_head = static_cast<std::int64_t>(head.second);

    std::size_t committed = 0;
    bool more = false;
    bool failed = false;

    try {
        bx::sync_state sync = db.get_sync_state();
        std::uint64_t next = next_height(sync);

        if (next <= head.second) {
            state = bx::indexer_state::CATCHING_UP;
        }

        while (next <= head.second) {
            if (committed >= cfg.batch_size) {
                more = true;
                break;
            }

            const std::pair<bx::node_status, bx::block> res = node.get_block(next);
            if (res.first != bx::node_status::OK) {
                register_node_failure("get_block " + std::to_string(next), res.first);
                failed = true;
                break;
            }

            const bx::block & block = res.second;
            if (block.height != next) {
                spdlog::warn("indexer: asked for block {} node returned {}", next, block.height);
                register_node_failure("get_block " + std::to_string(next), bx::node_status::UNAVAILABLE);
                failed = true;
                break;
            }

            if (has_tip(sync) && ! block.links_to(sync.tip_hash)) {
                ++prev_hash_rollbacks;
                if (prev_hash_rollbacks > cfg.resync_depth) {
                    halt(bx::integrity_fault(bx::fault_kind::REORG_BEYOND_LOOKBACK, next,
                        "prev hash mismatch persisted for " + std::to_string(prev_hash_rollbacks.load()) + " blocks"
                    ));
                    return committed;
                }

                spdlog::warn("indexer: block {} prev {} does not extend tip {}",
                    block.height, block.prev_hash.decompress(), sync.tip_hash.decompress()
                );

                rollback(static_cast<std::uint64_t>(sync.indexed_height), block.prev_hash);

                sync = db.get_sync_state();
                next = next_height(sync);
                continue;
            }

            commit_block(block);
            prev_hash_rollbacks = 0;
            ++committed;

            sync.indexed_height = static_cast<std::int64_t>(block.height);
            sync.tip_hash = block.hash;
            next = block.height + 1;
        }

        if (! failed) {
            node_failures = 0;
            touch_last_poll();
        }

        refresh_throughput();
    } catch (const bx::store_error& e) {
        spdlog::warn("indexer: store unavailable, poll abandoned: {}", e.what());
        settle_state();
        return committed;
    } catch (const bx::integrity_fault& e) {
        halt(e);
        return committed;
    }

    settle_state();

    if (more) {
        enqueue(work::poll);
    }

    return committed;
}

void indexer::resync_tick()
{
    if (state == bx::indexer_state::HALTED) {
        return;
    }

    writer_guard guard(*this);
    if (state == bx::indexer_state::HALTED) {
        return;
    }

    try {
        const bx::sync_state sync = db.get_sync_state();
        if (! has_tip(sync)) {
            settle_state();
            return;
        }

        state = bx::indexer_state::REORG_CHECK;
        handle_divergence(detector.find_divergence(sync.indexed_height));
    } catch (const bx::store_error& e) {
        spdlog::warn("indexer: store unavailable, resync abandoned: {}", e.what());
        settle_state();
    } catch (const bx::integrity_fault& e) {
        halt(e);
    }
}

bx::divergence indexer::verify(
    const std::uint64_t from,
    const std::uint64_t to
) {
    writer_guard guard(*this);

    const bx::divergence d = detector.verify_range(from, to);
    spdlog::info("indexer: verify {}..{} -> {}", from, to, bx::to_string(d.status));

    if (d.status == bx::reorg_status::DIVERGED && state != bx::indexer_state::HALTED) {
        try {
            rollback(d.height, d.new_hash);
        } catch (const bx::store_error&) {
            settle_state();
            throw;
        } catch (const bx::integrity_fault& e) {
            halt(e);
            return d;
        }
        settle_state();
    }

    return d;
}

void indexer::handle_divergence(const bx::divergence& d)
{
    switch (d.status) {
        case bx::reorg_status::NONE:
            settle_state();
            break;

        case bx::reorg_status::UNAVAILABLE:
            spdlog::warn("indexer: node unavailable during resync at {}, retrying next interval", d.height);
            settle_state();
            break;

        case bx::reorg_status::DIVERGED:
            rollback(d.height, d.new_hash);
            settle_state();
            break;

        case bx::reorg_status::MISSING:
            halt(bx::integrity_fault(bx::fault_kind::NODE_NOT_FOUND, d.height,
                "node no longer has block " + std::to_string(d.height)
            ));
            break;

        case bx::reorg_status::BEYOND_LOOKBACK:
            halt(bx::integrity_fault(bx::fault_kind::REORG_BEYOND_LOOKBACK, d.height,
                "fork point is below the " + std::to_string(cfg.resync_depth) + " block lookback"
            ));
            break;
    }
}

void indexer::commit_block(const bx::block& block)
{
    std::unique_ptr<bx::store_txn> txn = db.begin();

    txn->insert_block(block);

    const bx::block_effects effects = bx::aggregator::apply_block(block);
    for (const auto & m : effects.accounts) {
        const std::optional<bx::account> acc = txn->get_account(m.first);
        const bx::account updated = bx::aggregator::apply_delta(
            acc ? *acc : bx::account(m.first),
            m.second,
            bx::account_history()
        );

        if (updated.balance < 0) {
            throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, block.height,
                "balance of " + m.first + " would become " + bx::to_string(updated.balance)
            );
        }

        txn->put_account(updated);
    }

    bx::chain_totals totals = txn->get_totals();
    bx::aggregator::apply_totals(totals, effects);
    txn->put_totals(totals);

    bx::sync_state sync = txn->get_sync_state();
    sync.indexed_height = static_cast<std::int64_t>(block.height);
    sync.tip_hash = block.hash;
    txn->put_sync_state(sync);

    txn->commit();

    spdlog::info("indexer: committed block {} {} ({} txs)",
        block.height, block.hash.decompress(), block.txs.size()
    );

    if (on_commit) {
        try {
            on_commit(block);
        } catch (const std::exception& e) {
            spdlog::warn("indexer: commit notification failed: {}", e.what());
        }
    }
}

void indexer::rollback(
    const std::uint64_t  height,
    const bx::blockhash& new_hash
) {
    state = bx::indexer_state::ROLLING_BACK;

    std::unique_ptr<bx::store_txn> txn = db.begin();

    bx::sync_state sync = txn->get_sync_state();
    if (sync.indexed_height < static_cast<std::int64_t>(height)) {
        return;
    }

    bx::chain_totals totals = txn->get_totals();

    bx::reorg_event event;
    event.height      = height;
    event.new_hash    = new_hash;
    event.detected_at = clock();

    for (std::int64_t h=sync.indexed_height; h>=static_cast<std::int64_t>(height); --h) {
        const std::uint64_t uh = static_cast<std::uint64_t>(h);

        const std::optional<bx::block> block = txn->get_block(uh);
        if (! block) {
            throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, uh,
                "stored chain has a gap at " + std::to_string(uh)
            );
        }
        if (uh == height) {
            event.old_hash = block->hash;
        }

        const bx::block_effects effects = bx::aggregator::revert_block(*block);
        txn->delete_block(uh);

        for (const auto & m : effects.accounts) {
            const std::optional<bx::account> acc = txn->get_account(m.first);
            if (! acc) {
                throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, uh,
                    "account " + m.first + " touched by block " + std::to_string(uh) + " does not exist"
                );
            }

            const bx::account updated = bx::aggregator::apply_delta(
                *acc,
                m.second,
                txn->get_account_history(m.first, uh)
            );

            if (updated.balance < 0) {
                throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, uh,
                    "revert leaves " + m.first + " at " + bx::to_string(updated.balance)
                );
            }

            txn->put_account(updated);
        }

        bx::aggregator::apply_totals(totals, effects);
        ++event.blocks_reverted;
    }

    txn->put_totals(totals);

    if (height > cfg.genesis_height) {
        const std::optional<bx::block> parent = txn->get_block(height - 1);
        if (! parent) {
            throw bx::integrity_fault(bx::fault_kind::DATA_INTEGRITY, height - 1,
                "stored chain has a gap at " + std::to_string(height - 1)
            );
        }

        sync.indexed_height = static_cast<std::int64_t>(height) - 1;
        sync.tip_hash = parent->hash;
    } else {
        sync.indexed_height = static_cast<std::int64_t>(cfg.genesis_height) - 1;
        sync.tip_hash = bx::blockhash();
    }

    txn->put_sync_state(sync);
    txn->insert_reorg_event(event);
    txn->commit();

    spdlog::warn("indexer: rolled back {} blocks to {}, fork at {} old {} new {}",
        event.blocks_reverted, sync.indexed_height, height,
        event.old_hash.decompress(), event.new_hash.decompress()
    );

    state = bx::indexer_state::CATCHING_UP;

    if (on_reorg) {
        try {
            on_reorg(event);
        } catch (const std::exception& e) {
            spdlog::warn("indexer: reorg notification failed: {}", e.what());
        }
    }

    enqueue(work::poll);
}

void indexer::halt(const bx::integrity_fault& fault)
{
    state = bx::indexer_state::HALTED;

    const std::string reason = bx::to_string(fault.kind)
        + " at " + std::to_string(fault.height)
        + ": " + fault.what();

    {
        boost::lock_guard<boost::shared_mutex> lock(status_mtx);
        halt_reason = reason;
    }

    spdlog::error("indexer: halted, {}", reason);
}

void indexer::register_node_failure(
    const std::string&    what,
    const bx::node_status status
) {
    ++node_failures;
    spdlog::warn("indexer: node {} {}, retrying in {}ms",
        what, bx::to_string(status), poll_delay().count()
    );
}

void indexer::touch_last_poll()
{
    std::unique_ptr<bx::store_txn> txn = db.begin();
    bx::sync_state sync = txn->get_sync_state();
    sync.last_poll = clock();
    txn->put_sync_state(sync);
    txn->commit();
}

void indexer::refresh_throughput()
{
    const std::int64_t now = clock();
    const bx::throughput t = bx::aggregator::update_throughput_window(
        db.get_blocks_since(now - cfg.throughput_window),
        now,
        cfg.throughput_window
    );

    boost::lock_guard<boost::shared_mutex> lock(status_mtx);
    current_throughput = t;
}

void indexer::settle_state()
{
    if (state == bx::indexer_state::HALTED) {
        return;
    }

    try {
        const bx::sync_state sync = db.get_sync_state();
        const std::int64_t head = node_head;

        state = (head >= 0 && sync.indexed_height >= head)
            ? bx::indexer_state::SYNCED
            : bx::indexer_state::CATCHING_UP;
    } catch (const bx::store_error& e) {
        spdlog::warn("indexer: store unavailable reading sync state: {}", e.what());
        state = bx::indexer_state::CATCHING_UP;
    }
}

bx::indexer_status indexer::status()
{
    bx::indexer_status ret;
    ret.sync                   = db.get_sync_state();
    ret.state                  = state;
    ret.node_head              = node_head;
    ret.acquisitions           = acquisitions;
    ret.contended              = contended;
    ret.max_concurrent_writers = max_concurrent_writers;

    boost::shared_lock<boost::shared_mutex> lock(status_mtx);
    ret.halt_reason = halt_reason;

    return ret;
}

bx::throughput indexer::throughput()
{
    boost::shared_lock<boost::shared_mutex> lock(status_mtx);
    return current_throughput;
}

std::chrono::milliseconds indexer::poll_delay() const
{
    const std::uint64_t base     = static_cast<std::uint64_t>(cfg.poll_interval) * 1000;
    const std::uint32_t failures = std::min<std::uint32_t>(node_failures, 20);
    const std::uint64_t delay    = std::min<std::uint64_t>(base << failures, cfg.backoff_max_ms);

    return std::chrono::milliseconds(delay);
}

void indexer::enqueue(const work w)
{
    {
        std::lock_guard<std::mutex> lock(queue_mtx);
        if (std::find(queue.begin(), queue.end(), w) != queue.end()) {
            return;
        }
        queue.push_back(w);
    }

    queue_cv.notify_one();
}

void indexer::start()
{
    stop_requested = false;

    enqueue(work::poll);
    enqueue(work::resync);

    worker       = std::thread(&indexer::run_worker, this);
    poll_timer   = std::thread(&indexer::run_timer, this, work::poll);
    resync_timer = std::thread(&indexer::run_timer, this, work::resync);

    spdlog::info("indexer: started, poll every {}s, resync every {}s over {} blocks",
        cfg.poll_interval, cfg.resync_interval, cfg.resync_depth
    );
}

void indexer::stop()
{
    {
        std::lock_guard<std::mutex> lock(queue_mtx);
        stop_requested = true;
    }
    queue_cv.notify_all();

    {
        std::lock_guard<std::mutex> lock(timer_mtx);
    }
    timer_cv.notify_all();

    for (std::thread * t : { &worker, &poll_timer, &resync_timer }) {
        if (t->joinable()) {
            t->join();
        }
    }
}

void indexer::run_worker()
{
    while (true) {
        work w;
        {
            std::unique_lock<std::mutex> lock(queue_mtx);
            queue_cv.wait(lock, [&] { return stop_requested || ! queue.empty(); });
            if (stop_requested) {
                return;
            }

            w = queue.front();
            queue.pop_front();
        }

        try {
            if (w == work::poll) {
                poll_tick();
            } else {
                resync_tick();
            }
        } catch (const std::exception& e) {
            spdlog::error("indexer: {} tick failed: {}", w == work::poll ? "poll" : "resync", e.what());
        }
    }
}

void indexer::run_timer(const work w)
{
    while (true) {
        const std::chrono::milliseconds delay = w == work::poll
            ? poll_delay()
            : std::chrono::milliseconds(static_cast<std::uint64_t>(cfg.resync_interval) * 1000);

        std::unique_lock<std::mutex> lock(timer_mtx);
        if (timer_cv.wait_for(lock, delay, [&] { return stop_requested.load(); })) {
            return;
        }
        lock.unlock();

        enqueue(w);
    }
}

}
