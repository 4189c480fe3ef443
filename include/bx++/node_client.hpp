#ifndef BX_NODE_CLIENT_HPP
#define BX_NODE_CLIENT_HPP

#include <cstdint>
#include <string>
#include <utility>

#include <bx++/bhash.hpp>
#include <bx++/block.hpp>

namespace bx {

enum class node_status
{
    OK,
    UNAVAILABLE, // transient, retry with backoff
    NOT_FOUND    // not produced (yet), or no longer part of the chain
};

std::string to_string(const bx::node_status status);

// read only view of the chain node
// every call is idempotent and safe to retry
struct node_client
{
    virtual ~node_client() = default;

    virtual std::pair<bx::node_status, std::uint64_t> current_height() = 0;

    virtual std::pair<bx::node_status, bx::block> get_block(const std::uint64_t height) = 0;
    virtual std::pair<bx::node_status, bx::block> get_block(const bx::blockhash& hash) = 0;
};

}

#endif
