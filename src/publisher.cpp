#include <array>
#include <string>
#include <zmq_addon.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <bx++/util.hpp>
#include <bx++/codec.hpp>
#include <bx++/publisher.hpp>

namespace bx {

publisher::publisher(const std::string& bind)
: context()
, sock(context, zmq::socket_type::pub)
{
    sock.bind(bind);
    spdlog::info("publisher: bound {}", bind);
}

void publisher::publish_block(const bx::block& block)
{
    send("block", bx::codec::block_to_json(block).dump());
    last_block_unix = bx::util::current_time();
}

void publisher::publish_reorg(const bx::reorg_event& event)
{
    spdlog::info("publishing zmq reorg at {}", event.height);
    send("reorg", bx::codec::reorg_event_to_json(event).dump());
    last_reorg_unix = bx::util::current_time();
}

void publisher::send(const std::string& topic, const std::string& payload)
{
    std::array<zmq::const_buffer, 2> msgs = {
        zmq::buffer(topic),
        zmq::buffer(payload)
    };

    // pub sockets drop instead of blocking when no subscriber keeps up
    if (! zmq::send_multipart(sock, msgs, zmq::send_flags::dontwait)) {
        spdlog::warn("publisher: {} message dropped", topic);
    }
}

}
