#ifndef BX_RPC_HPP
#define BX_RPC_HPP

#include <string>
#include <cstdint>
#include <utility>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <bx++/bhash.hpp>
#include <bx++/block.hpp>
#include <bx++/node_client.hpp>

namespace bx {

// http adapter for the chain node
struct rpc : public bx::node_client
{
    httplib::Client cli;
    std::string     height_metric;

    rpc(
        const std::string   rpc_host,
        const std::uint16_t rpc_port,
        const std::string   height_metric,
        const std::uint32_t timeout_seconds
    );

    std::pair<bx::node_status, std::string> query(const std::string & path);

    std::pair<bx::node_status, std::uint64_t> current_height() override;

    std::pair<bx::node_status, bx::block> get_block(const std::uint64_t height) override;
    std::pair<bx::node_status, bx::block> get_block(const bx::blockhash& hash) override;

private:
    std::pair<bx::node_status, bx::block> fetch_block(const std::string & path);
};

}


#endif
