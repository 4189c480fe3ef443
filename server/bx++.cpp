#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <atomic>
#include <chrono>
#include <memory>
#include <cstdlib>
#include <cstdint>
#include <csignal>

#include <grpc++/grpc++.h>
#include <spdlog/spdlog.h>
#include <zmq.hpp>

#include "indexer.grpc.pb.h"

#include <bx++/bx++.hpp>
#include <bx++/config.hpp>
#include <bx++/error.hpp>
#include <bx++/store.hpp>
#include <bx++/memdb.hpp>
#include <bx++/mdatabase.hpp>
#include <bx++/rpc.hpp>
#include <bx++/indexer.hpp>
#include <bx++/publisher.hpp>
#include <bx++/amount.hpp>

std::unique_ptr<grpc::Server> gserver;
std::atomic<bool> exit_early = { false };

const std::chrono::milliseconds await_time { 1000 };

void signal_handler(int signal)
{
    spdlog::info("received signal {} requesting to shut down", signal);

    exit_early = true;

    if (gserver) {
        const auto deadline = std::chrono::system_clock::now() +
                              std::chrono::milliseconds(1000);
        gserver->Shutdown(deadline);
    }
}

class IndexerServiceImpl final
 : public bxrpc::IndexerService::Service
{
    bx::indexer &   indexer;
    bx::store &     db;
    bx::publisher * pub;

public:
    IndexerServiceImpl(
        bx::indexer &   indexer,
        bx::store &     db,
        bx::publisher * pub
    )
    : indexer(indexer)
    , db(db)
    , pub(pub)
    {}

    grpc::Status Status (
        grpc::ServerContext* context,
        const bxrpc::StatusRequest* request,
        bxrpc::StatusReply* reply
    ) override {
        try {
            const bx::indexer_status status = indexer.status();
            const bx::chain_totals totals = db.get_totals();

            reply->set_state(bx::to_string(status.state));
            reply->set_indexed_height(status.sync.indexed_height);
            reply->set_tip_hash(status.sync.tip_hash.decompress());
            reply->set_last_poll(status.sync.last_poll);
            reply->set_node_head(status.node_head);
            reply->set_halt_reason(status.halt_reason);

            reply->set_total_fees(bx::to_string(totals.fees));
            reply->set_total_transferred(bx::to_string(totals.transferred));
            reply->set_total_bonded(bx::to_string(totals.bonded));
            reply->set_total_blocks(totals.blocks);
            reply->set_total_transactions(totals.transactions);

            reply->set_acquisitions(status.acquisitions);
            reply->set_contended(status.contended);
            reply->set_max_concurrent_writers(status.max_concurrent_writers);

            if (pub) {
                reply->set_last_published_block_unix(pub->last_block_unix);
                reply->set_last_published_reorg_unix(pub->last_reorg_unix);
            }
        } catch (const bx::store_error& e) {
            return { grpc::StatusCode::UNAVAILABLE, e.what() };
        }

        return { grpc::Status::OK };
    }

    grpc::Status Throughput (
        grpc::ServerContext* context,
        const bxrpc::ThroughputRequest* request,
        bxrpc::ThroughputReply* reply
    ) override {
        const bx::throughput t = indexer.throughput();

        reply->set_current_tps(t.current_tps);
        reply->set_avg_tps_1h(t.avg_tps_1h);
        reply->set_avg_block_time(t.avg_block_time);
        reply->set_blocks_in_window(t.blocks_in_window);
        reply->set_txs_in_window(t.txs_in_window);

        return { grpc::Status::OK };
    }

    grpc::Status ReorgEvents (
        grpc::ServerContext* context,
        const bxrpc::ReorgEventsRequest* request,
        bxrpc::ReorgEventsReply* reply
    ) override {
        const std::size_t limit = request->limit() == 0 ? 20 : request->limit();

        try {
            for (const bx::reorg_event & e : db.get_reorg_events(limit)) {
                bxrpc::ReorgEvent* el = reply->add_events();
                el->set_height(e.height);
                el->set_old_hash(e.old_hash.decompress());
                el->set_new_hash(e.new_hash.decompress());
                el->set_blocks_reverted(e.blocks_reverted);
                el->set_detected_at(e.detected_at);
            }
        } catch (const bx::store_error& e) {
            return { grpc::StatusCode::UNAVAILABLE, e.what() };
        }

        return { grpc::Status::OK };
    }

    grpc::Status Verify (
        grpc::ServerContext* context,
        const bxrpc::VerifyRequest* request,
        bxrpc::VerifyReply* reply
    ) override {
        if (request->from() > request->to()) {
            return { grpc::StatusCode::INVALID_ARGUMENT, "from must not exceed to" };
        }

        const auto start = std::chrono::steady_clock::now();

        try {
            const bx::divergence d = indexer.verify(request->from(), request->to());

            reply->set_status(bx::to_string(d.status));
            reply->set_height(d.height);
            reply->set_old_hash(d.old_hash.decompress());
            reply->set_new_hash(d.new_hash.decompress());
        } catch (const bx::store_error& e) {
            return { grpc::StatusCode::UNAVAILABLE, e.what() };
        }

        const auto end = std::chrono::steady_clock::now();
        const auto diff_ms = std::chrono::duration<double, std::milli>(end - start).count();

        spdlog::info("verify: {}..{} {} ({} ms)", request->from(), request->to(), reply->status(), diff_ms);
        return { grpc::Status::OK };
    }
};

int main(int argc, char * argv[])
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (argc < 2) {
        std::cerr << "usage: bx++ config.toml\n";
        return EXIT_FAILURE;
    }

    bx::config config;
    try {
        config = bx::config::load(argv[1]);
    } catch (const std::exception& e) {
        spdlog::error("config: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::set_level(spdlog::level::from_str(config.log_level));
    spdlog::info("bx++ v{}", BX_VERSION);

    std::unique_ptr<bx::store> db;
    if (config.store_backend == "mongo") {
        try {
            auto mdb = std::make_unique<bx::mdatabase>(config.mongo_db, config.mongo_uri);
            mdb->create_indexes();
            db = std::move(mdb);
        } catch (const std::exception& e) {
            spdlog::error("could not open mongo store: {}", e.what());
            return EXIT_FAILURE;
        }
    } else {
        spdlog::warn("using in memory store, nothing survives a restart");
        db = std::make_unique<bx::memdb>();
    }

    bx::rpc rpc(
        config.node_host,
        config.node_port,
        config.node_height_metric,
        config.node_timeout
    );

    bx::indexer indexer(rpc, *db, config.indexer);

    std::unique_ptr<bx::publisher> pub;
    if (config.zmqpub) {
        try {
            pub = std::make_unique<bx::publisher>(config.zmqpub_bind);
        } catch (const zmq::error_t& e) {
            spdlog::error("zmqpub bind {} failed: {}", config.zmqpub_bind, e.what());
            return EXIT_FAILURE;
        }

        indexer.on_commit = [&pub](const bx::block& block) {
            pub->publish_block(block);
        };
        indexer.on_reorg = [&pub](const bx::reorg_event& event) {
            pub->publish_reorg(event);
        };
    }

    try {
        indexer.seed_genesis(config.genesis);

        const bx::sync_state sync = db->get_sync_state();
        spdlog::info("resuming from height {} tip {}", sync.indexed_height, sync.tip_hash.decompress());
    } catch (const bx::store_error& e) {
        spdlog::error("could not read store: {}", e.what());
        return EXIT_FAILURE;
    }

    indexer.start();

    if (! exit_early && config.grpc) {
        const std::string server_address(
            config.grpc_host+
            ":"+
            std::to_string(config.grpc_port)
        );

        IndexerServiceImpl indexer_service(indexer, *db, pub.get());
        grpc::ServerBuilder builder;
        builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
        builder.RegisterService(&indexer_service);
        gserver = builder.BuildAndStart();
        spdlog::info("bx++ listening on {}", server_address);

        if (gserver) {
            gserver->Wait();
        }
    }

    while (! exit_early) {
        std::this_thread::sleep_for(await_time);
    }

    indexer.stop();

    spdlog::info("goodbye");

    return EXIT_SUCCESS;
}
