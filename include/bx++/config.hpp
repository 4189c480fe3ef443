#ifndef BX_CONFIG_HPP
#define BX_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <bx++/indexer.hpp>

namespace bx {

struct config
{
    std::string   node_host;
    std::uint16_t node_port;
    std::string   node_height_metric;
    std::uint32_t node_timeout;

    bx::indexer_config indexer;

    std::string store_backend; // "mongo" or "memory"
    std::string mongo_uri;
    std::string mongo_db;

    bool          grpc;
    std::string   grpc_host;
    std::uint16_t grpc_port;

    bool        zmqpub;
    std::string zmqpub_bind;

    std::string log_level;

    std::vector<bx::genesis_allocation> genesis;

    // throws toml::exception on syntax/type errors and std::runtime_error
    // on values that parse but make no sense
    static bx::config load(const std::string& path);
};

}

#endif
