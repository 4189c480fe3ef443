#include <chrono>
#include <bx++/util.hpp>

namespace bx {

namespace util {

std::int64_t current_time()
{
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

}

}
