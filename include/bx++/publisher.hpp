#ifndef BX_PUBLISHER_HPP
#define BX_PUBLISHER_HPP

#include <string>
#include <atomic>
#include <cstdint>
#include <zmq.hpp>
#include <bx++/block.hpp>
#include <bx++/sync_state.hpp>

namespace bx {

// zmq pub socket, topics "block" and "reorg", json payloads
struct publisher
{
    zmq::context_t context;
    zmq::socket_t  sock;

    std::atomic<std::uint64_t> last_block_unix { 0 };
    std::atomic<std::uint64_t> last_reorg_unix { 0 };

    explicit publisher(const std::string& bind);

    void publish_block(const bx::block& block);
    void publish_reorg(const bx::reorg_event& event);

private:
    void send(const std::string& topic, const std::string& payload);
};

}

#endif
