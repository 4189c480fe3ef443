#ifndef BX_ERROR_HPP
#define BX_ERROR_HPP

#include <cstdint>
#include <string>
#include <stdexcept>

namespace bx {

enum class fault_kind
{
    NODE_UNAVAILABLE,
    NODE_NOT_FOUND,
    STORE_UNAVAILABLE,
    DATA_INTEGRITY,
    REORG_BEYOND_LOOKBACK
};

std::string to_string(const bx::fault_kind kind);

// transient, the cycle that raised it is retried from unchanged state
struct store_error : public std::runtime_error
{
    explicit store_error(const std::string& what)
    : std::runtime_error(what)
    {}
};

// not retried, indexing halts until an operator intervenes
struct integrity_fault : public std::runtime_error
{
    bx::fault_kind kind;
    std::uint64_t  height;

    integrity_fault(
        const bx::fault_kind kind,
        const std::uint64_t  height,
        const std::string&   what
    )
    : std::runtime_error(what)
    , kind(kind)
    , height(height)
    {}
};

}

#endif
