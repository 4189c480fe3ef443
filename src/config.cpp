#include <stdexcept>
#include <string>
#include <toml.hpp>
#include <bx++/config.hpp>

namespace bx {

namespace {

template <typename T>
T find_or(const toml::value& v, const std::string& key, const T def)
{
    if (! v.is_table() || ! v.contains(key)) {
        return def;
    }

    return toml::find<T>(v, key);
}

const toml::value & section(const toml::value& data, const std::string& key)
{
    static const toml::value empty = toml::table{};
    return data.contains(key) ? toml::find(data, key) : empty;
}

bx::amount allocation_balance(const toml::value& v)
{
    const toml::value & balance = toml::find(v, "balance");
    if (balance.is_integer()) {
        return bx::amount(balance.as_integer());
    }

    const std::pair<bool, bx::amount> parsed = bx::parse_amount(toml::get<std::string>(balance));
    if (! parsed.first || parsed.second < 0) {
        throw std::runtime_error("genesis balance is not a non-negative integer");
    }

    return parsed.second;
}

}

bx::config config::load(const std::string& path)
{
    const auto data = toml::parse(path);

    bx::config ret;

    ret.node_host          = toml::find<std::string>  (data, "node", "host");
    ret.node_port          = toml::find<std::uint16_t>(data, "node", "port");
    ret.node_height_metric = find_or<std::string>(section(data, "node"), "height_metric", "computechain_block_height");
    ret.node_timeout       = find_or<std::uint32_t>(section(data, "node"), "timeout", 10);

    const toml::value & indexer = section(data, "indexer");
    ret.indexer.poll_interval     = find_or<std::uint32_t>(indexer, "poll_interval",     ret.indexer.poll_interval);
    ret.indexer.resync_interval   = find_or<std::uint32_t>(indexer, "resync_interval",   ret.indexer.resync_interval);
    ret.indexer.resync_depth      = find_or<std::uint32_t>(indexer, "resync_depth",      ret.indexer.resync_depth);
    ret.indexer.genesis_height    = find_or<std::uint64_t>(indexer, "genesis_height",    ret.indexer.genesis_height);
    ret.indexer.batch_size        = find_or<std::uint32_t>(indexer, "batch_size",        ret.indexer.batch_size);
    ret.indexer.backoff_max_ms    = find_or<std::uint32_t>(indexer, "backoff_max_ms",    ret.indexer.backoff_max_ms);
    ret.indexer.throughput_window = find_or<std::int64_t> (indexer, "throughput_window", ret.indexer.throughput_window);

    if (ret.indexer.poll_interval == 0 || ret.indexer.resync_interval == 0) {
        throw std::runtime_error("indexer intervals must be at least one second");
    }
    if (ret.indexer.resync_depth == 0) {
        throw std::runtime_error("indexer.resync_depth must be positive");
    }
    if (ret.indexer.batch_size == 0) {
        throw std::runtime_error("indexer.batch_size must be positive");
    }
    if (ret.indexer.throughput_window <= 0) {
        throw std::runtime_error("indexer.throughput_window must be positive");
    }

    ret.store_backend = toml::find<std::string>(data, "services", "store");
    if (ret.store_backend != "mongo" && ret.store_backend != "memory") {
        throw std::runtime_error("services.store must be \"mongo\" or \"memory\"");
    }
    if (ret.store_backend == "mongo") {
        ret.mongo_uri = toml::find<std::string>(data, "mongo", "uri");
        ret.mongo_db  = toml::find<std::string>(data, "mongo", "db");
    }

    ret.grpc = toml::find<bool>(data, "services", "grpc");
    if (ret.grpc) {
        ret.grpc_host = toml::find<std::string>  (data, "grpc", "host");
        ret.grpc_port = toml::find<std::uint16_t>(data, "grpc", "port");
    }

    ret.zmqpub = toml::find<bool>(data, "services", "zmqpub");
    if (ret.zmqpub) {
        ret.zmqpub_bind = toml::find<std::string>(data, "zmqpub", "bind");
    }

    ret.log_level = find_or<std::string>(section(data, "log"), "level", "info");

    const toml::value & genesis = section(data, "genesis");
    if (genesis.contains("allocations")) {
        for (const toml::value & v : toml::find<toml::array>(genesis, "allocations")) {
            bx::genesis_allocation alloc;
            alloc.address = toml::find<std::string>(v, "address");
            alloc.balance = allocation_balance(v);
            ret.genesis.push_back(alloc);
        }
    }

    return ret;
}

}
