#ifndef BX_INDEXER_HPP
#define BX_INDEXER_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <deque>
#include <atomic>
#include <mutex>
#include <thread>
#include <chrono>
#include <functional>
#include <condition_variable>

#include <boost/thread.hpp>

#include <bx++/amount.hpp>
#include <bx++/block.hpp>
#include <bx++/sync_state.hpp>
#include <bx++/aggregator.hpp>
#include <bx++/node_client.hpp>
#include <bx++/store.hpp>
#include <bx++/reorg_detector.hpp>
#include <bx++/error.hpp>

namespace bx {

enum class indexer_state
{
    CATCHING_UP,
    SYNCED,
    REORG_CHECK,
    ROLLING_BACK,
    HALTED
};

std::string to_string(const bx::indexer_state state);

struct genesis_allocation
{
    std::string address;
    bx::amount  balance;
};

struct indexer_config
{
    std::uint32_t poll_interval     { 2 };   // seconds between catch-up ticks
    std::uint32_t resync_interval   { 300 }; // seconds between reorg checks
    std::uint32_t resync_depth      { 10 };  // trailing blocks re-verified per check
    std::uint64_t genesis_height    { 0 };
    std::uint32_t batch_size        { 50 };  // blocks committed per tick before yielding
    std::uint32_t backoff_max_ms    { 60000 };
    std::int64_t  throughput_window { 3600 };
};

struct indexer_status
{
    bx::indexer_state state;
    bx::sync_state    sync;
    std::int64_t      node_head;
    std::string       halt_reason;
    std::uint64_t     acquisitions;
    std::uint64_t     contended;
    int               max_concurrent_writers;
};

// single writer of the replica
// poll ticks, resync ticks, rollbacks and operator verification are
// serialized on processing_mutex, timers only ever enqueue work
struct indexer
{
    enum class work { poll, resync };

    bx::node_client &   node;
    bx::store &         db;
    bx::indexer_config  cfg;
    bx::reorg_detector  detector;

    std::function<std::int64_t()>                clock;
    std::function<void(const bx::block&)>        on_commit;
    std::function<void(const bx::reorg_event&)>  on_reorg;

    boost::shared_mutex processing_mutex;

    // exclusion instrumentation
    std::atomic<int>           active_writers { 0 };
    std::atomic<int>           max_concurrent_writers { 0 };
    std::atomic<std::uint64_t> acquisitions { 0 };
    std::atomic<std::uint64_t> contended { 0 };

    std::atomic<bx::indexer_state> state { bx::indexer_state::CATCHING_UP };
    std::atomic<std::int64_t>      node_head { -1 };
    std::atomic<std::uint32_t>     node_failures { 0 };
    std::atomic<std::uint32_t>     prev_hash_rollbacks { 0 };

    boost::shared_mutex status_mtx; // guards halt_reason and current_throughput
    std::string         halt_reason;
    bx::throughput      current_throughput;

    std::atomic<bool>       stop_requested { false };
    std::mutex              queue_mtx;
    std::condition_variable queue_cv;
    std::deque<work>        queue;
    std::mutex              timer_mtx;
    std::condition_variable timer_cv;
    std::thread             worker;
    std::thread             poll_timer;
    std::thread             resync_timer;

    indexer(
        bx::node_client &         node,
        bx::store &               db,
        const bx::indexer_config& cfg
    );

    ~indexer();

    indexer(const indexer&) = delete;
    indexer& operator=(const indexer&) = delete;

    // writes allocations for accounts that do not exist yet
    void seed_genesis(const std::vector<bx::genesis_allocation>& allocations);

    // returns number of blocks committed
    std::size_t poll_tick();
    void resync_tick();

    // operator triggered re-verification of an explicit range
    bx::divergence verify(
        const std::uint64_t from,
        const std::uint64_t to
    );

    void start();
    void stop();
    void enqueue(const work w);

    bx::indexer_status status();
    bx::throughput throughput();
    std::chrono::milliseconds poll_delay() const;

private:
    bool has_tip(const bx::sync_state& sync) const;
    std::uint64_t next_height(const bx::sync_state& sync) const;

    void commit_block(const bx::block& block);
    void rollback(
        const std::uint64_t  height,
        const bx::blockhash& new_hash
    );
    void handle_divergence(const bx::divergence& d);
    void halt(const bx::integrity_fault& fault);
    void register_node_failure(
        const std::string&    what,
        const bx::node_status status
    );
    void touch_last_poll();
    void refresh_throughput();
    void settle_state();

    void run_worker();
    void run_timer(const work w);
};

}

#endif
