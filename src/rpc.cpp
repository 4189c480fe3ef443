#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <bx++/codec.hpp>
#include <bx++/rpc.hpp>

namespace bx {

rpc::rpc(
    const std::string   rpc_host,
    const std::uint16_t rpc_port,
    const std::string   height_metric,
    const std::uint32_t timeout_seconds
)
: cli(rpc_host, rpc_port)
, height_metric(height_metric)
{
    cli.set_connection_timeout(timeout_seconds, 0);
    cli.set_read_timeout(timeout_seconds, 0);
}

std::pair<bx::node_status, std::string> rpc::query(const std::string & path)
{
    auto res = cli.Get(path.c_str());
    if (! res) {
        return { bx::node_status::UNAVAILABLE, "" };
    }

    if (res->status == 404) {
        return { bx::node_status::NOT_FOUND, "" };
    }

    if (res->status != 200) {
        spdlog::warn("rpc: GET {} returned {}", path, res->status);
        return { bx::node_status::UNAVAILABLE, "" };
    }

    return { bx::node_status::OK, res->body };
}

std::pair<bx::node_status, std::uint64_t> rpc::current_height()
{
    const std::pair<bx::node_status, std::string> res = query("/metrics");
    if (res.first != bx::node_status::OK) {
        // the head itself never disappears, a missing endpoint means the node is not serving
        return { bx::node_status::UNAVAILABLE, 0 };
    }

    const std::pair<bool, std::uint64_t> height = bx::codec::parse_height_metric(res.second, height_metric);
    if (! height.first) {
        spdlog::warn("rpc: metric {} not found", height_metric);
        return { bx::node_status::UNAVAILABLE, 0 };
    }

    return { bx::node_status::OK, height.second };
}

std::pair<bx::node_status, bx::block> rpc::get_block(const std::uint64_t height)
{
    std::pair<bx::node_status, bx::block> res = fetch_block("/block/" + std::to_string(height));
    if (res.first == bx::node_status::OK && res.second.height != height) {
        spdlog::warn("rpc: GET /block/{} returned block {}", height, res.second.height);
        return { bx::node_status::UNAVAILABLE, {} };
    }

    return res;
}

std::pair<bx::node_status, bx::block> rpc::get_block(const bx::blockhash& hash)
{
    return fetch_block("/block/" + hash.decompress());
}

std::pair<bx::node_status, bx::block> rpc::fetch_block(const std::string & path)
{
    const std::pair<bx::node_status, std::string> res = query(path);
    if (res.first != bx::node_status::OK) {
        return { res.first, {} };
    }

    const nlohmann::json jbody = nlohmann::json::parse(res.second, nullptr, false);
    if (jbody.is_discarded()) {
        spdlog::warn("rpc: GET {} returned unparseable body", path);
        return { bx::node_status::UNAVAILABLE, {} };
    }

    // null body, the node has no such block
    if (jbody.is_null()) {
        return { bx::node_status::NOT_FOUND, {} };
    }

    const std::pair<bool, bx::block> block = bx::codec::block_from_json(jbody);
    if (! block.first) {
        return { bx::node_status::UNAVAILABLE, {} };
    }

    return { bx::node_status::OK, block.second };
}

}
