#include <iostream>
#include <bx++/block.hpp>

std::ostream & operator<<(std::ostream &os, const bx::block & block)
{
    os
        << "height:      " << block.height << "\n"
        << "hash:        " << block.hash.decompress() << "\n"
        << "prev_hash:   " << block.prev_hash.decompress() << "\n"
        << "timestamp:   " << block.timestamp << "\n"
        << "proposer:    " << block.proposer_address << "\n"
        << "tx_root:     " << block.tx_root << "\n"
        << "state_root:  " << block.state_root << "\n"
        << "gas:         " << block.gas_used << "/" << block.gas_limit << "\n"
        << "tx_count:    " << block.tx_count << "\n";

    for (const auto & tx : block.txs) {
        os << "--------------------------------------------------------------------------------\n";
        os << tx;
    }

    return os;
}
