#include <bx++/error.hpp>
#include <bx++/node_client.hpp>

namespace bx {

std::string to_string(const bx::fault_kind kind)
{
    switch (kind) {
        case bx::fault_kind::NODE_UNAVAILABLE:      return "NodeUnavailable";
        case bx::fault_kind::NODE_NOT_FOUND:        return "NodeNotFound";
        case bx::fault_kind::STORE_UNAVAILABLE:     return "StoreUnavailable";
        case bx::fault_kind::DATA_INTEGRITY:        return "DataIntegrityFault";
        case bx::fault_kind::REORG_BEYOND_LOOKBACK: return "ReorgBeyondLookback";
    }

    return "Unknown";
}

std::string to_string(const bx::node_status status)
{
    switch (status) {
        case bx::node_status::OK:          return "ok";
        case bx::node_status::UNAVAILABLE: return "unavailable";
        case bx::node_status::NOT_FOUND:   return "not found";
    }

    return "unknown";
}

}
