#include <iostream>
#include <memory>
#include <chrono>
#include <string>
#include <sstream>
#include <cstdlib>
#include <cstdint>
#include <unistd.h>
#include <getopt.h>

#include <grpc++/grpc++.h>
#include "indexer.grpc.pb.h"

#include <bx++/bx++.hpp>

class IndexerServiceClient
{
public:
    IndexerServiceClient(std::shared_ptr<grpc::Channel> channel)
    : stub_(bxrpc::IndexerService::NewStub(channel))
    {}

    bool Status()
    {
        bxrpc::StatusRequest request;
        bxrpc::StatusReply reply;

        grpc::ClientContext context;
        grpc::Status status = stub_->Status(&context, request, &reply);
        if (! status.ok()) {
            std::cout << status.error_code() << ": " << status.error_message() << std::endl;
            return false;
        }

        std::cout
            << "state:              " << reply.state() << "\n"
            << "indexed height:     " << reply.indexed_height() << "\n"
            << "tip hash:           " << reply.tip_hash() << "\n"
            << "last poll:          " << reply.last_poll() << "\n"
            << "node head:          " << reply.node_head() << "\n";

        if (! reply.halt_reason().empty()) {
            std::cout << "halt reason:        " << reply.halt_reason() << "\n";
        }

        std::cout
            << "total fees:         " << reply.total_fees() << "\n"
            << "total transferred:  " << reply.total_transferred() << "\n"
            << "total bonded:       " << reply.total_bonded() << "\n"
            << "total blocks:       " << reply.total_blocks() << "\n"
            << "total transactions: " << reply.total_transactions() << "\n"
            << "writer acquisitions " << reply.acquisitions()
            << " contended " << reply.contended()
            << " max concurrent " << reply.max_concurrent_writers() << "\n";

        return true;
    }

    bool Throughput()
    {
        bxrpc::ThroughputRequest request;
        bxrpc::ThroughputReply reply;

        grpc::ClientContext context;
        grpc::Status status = stub_->Throughput(&context, request, &reply);
        if (! status.ok()) {
            std::cout << status.error_code() << ": " << status.error_message() << std::endl;
            return false;
        }

        std::cout
            << "current tps:    " << reply.current_tps() << "\n"
            << "avg tps (1h):   " << reply.avg_tps_1h() << "\n"
            << "avg block time: " << reply.avg_block_time() << "s\n"
            << "window:         " << reply.blocks_in_window() << " blocks "
                                  << reply.txs_in_window() << " txs\n";

        return true;
    }

    bool ReorgEvents(const std::uint32_t limit)
    {
        bxrpc::ReorgEventsRequest request;
        request.set_limit(limit);

        bxrpc::ReorgEventsReply reply;

        grpc::ClientContext context;
        grpc::Status status = stub_->ReorgEvents(&context, request, &reply);
        if (! status.ok()) {
            std::cout << status.error_code() << ": " << status.error_message() << std::endl;
            return false;
        }

        for (auto & e : reply.events()) {
            std::cout
                << e.detected_at() << "\t"
                << e.height() << "\t"
                << e.blocks_reverted() << "\t"
                << e.old_hash() << " -> " << e.new_hash() << "\n";
        }

        return true;
    }

    bool Verify(const std::uint64_t from, const std::uint64_t to)
    {
        bxrpc::VerifyRequest request;
        request.set_from(from);
        request.set_to(to);

        bxrpc::VerifyReply reply;

        grpc::ClientContext context;
        grpc::Status status = stub_->Verify(&context, request, &reply);
        if (! status.ok()) {
            std::cout << status.error_code() << ": " << status.error_message() << std::endl;
            return false;
        }

        std::cout << reply.status();
        if (reply.status() != "none") {
            std::cout << " at " << reply.height() << " ours " << reply.old_hash() << " node " << reply.new_hash();
        }
        std::cout << "\n";

        return reply.status() == "none";
    }

private:
    std::unique_ptr<bxrpc::IndexerService::Stub> stub_;
};

int main(int argc, char* argv[])
{
    std::string grpc_host = "0.0.0.0";
    std::string grpc_port = "50051";
    std::string query_type = "status";

    const std::string usage_str = "usage: bx++-cli [--version] [--help] [--host host_address] [--port port]\n"
                                  "[--status] [--throughput] [--reorgs [LIMIT]] [--verify FROM TO]\n";

    while (true) {
        static struct option long_options[] = {
            { "help",    no_argument,       nullptr, 'h' },
            { "version", no_argument,       nullptr, 'v' },
            { "host",    required_argument, nullptr, 'b' },
            { "port",    required_argument, nullptr, 'p' },

            { "status",     no_argument, nullptr, 1000 },
            { "throughput", no_argument, nullptr, 1001 },
            { "reorgs",     no_argument, nullptr, 1002 },
            { "verify",     no_argument, nullptr, 1003 },
            { nullptr,      0,           nullptr, 0 }
        };

        int option_index = 0;
        int c = getopt_long(argc, argv, "hvb:p:", long_options, &option_index);

        if (c == -1) {
            break;
        }

        std::stringstream ss(optarg != nullptr ? optarg : "");
        switch (c) {
            case 0:
                break;
            case 'h':
                std::cout << usage_str;
                return EXIT_SUCCESS;
            case 'v':
                std::cout <<
                    "bx++-cli v" << BX_VERSION << std::endl;
                return EXIT_SUCCESS;
            case 'b': ss >> grpc_host; break;
            case 'p': ss >> grpc_port; break;

            case 1000: query_type = "status";     break;
            case 1001: query_type = "throughput"; break;
            case 1002: query_type = "reorgs";     break;
            case 1003: query_type = "verify";     break;

            case '?':
                return EXIT_FAILURE;
            default:
                return EXIT_FAILURE;
        }
    }

    IndexerServiceClient indexer(
        grpc::CreateChannel(
            grpc_host+":"+grpc_port,
            grpc::InsecureChannelCredentials()
        )
    );

    bool ok = false;
    if (query_type == "status") {
        ok = indexer.Status();
    } else if (query_type == "throughput") {
        ok = indexer.Throughput();
    } else if (query_type == "reorgs") {
        std::uint32_t limit = 20;
        if (optind < argc) {
            std::stringstream ss(argv[optind]);
            ss >> limit;
        }
        ok = indexer.ReorgEvents(limit);
    } else if (query_type == "verify") {
        if (argc - optind != 2) {
            std::cerr << "verify requires FROM and TO arguments\n";
            return EXIT_FAILURE;
        }

        std::uint64_t from = 0;
        std::uint64_t to = 0;
        {
            std::stringstream ss(argv[optind]);
            ss >> from;
        }
        {
            std::stringstream ss(argv[optind+1]);
            ss >> to;
        }

        ok = indexer.Verify(from, to);
    }

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
