#include <iostream>
#include <bx++/transaction.hpp>

namespace bx {

std::string to_string(const bx::tx_type type)
{
    switch (type) {
        case bx::tx_type::transfer:         return "TRANSFER";
        case bx::tx_type::stake:            return "STAKE";
        case bx::tx_type::unstake:          return "UNSTAKE";
        case bx::tx_type::delegate:         return "DELEGATE";
        case bx::tx_type::undelegate:       return "UNDELEGATE";
        case bx::tx_type::update_validator: return "UPDATE_VALIDATOR";
        case bx::tx_type::unjail:           return "UNJAIL";
        case bx::tx_type::compute:          return "COMPUTE";
        case bx::tx_type::submit_result:    return "SUBMIT_RESULT";
    }

    return "UNKNOWN";
}

std::pair<bool, bx::tx_type> tx_type_from_string(const std::string& s)
{
    static const std::pair<const char*, bx::tx_type> names[] = {
        { "TRANSFER",         bx::tx_type::transfer },
        { "STAKE",            bx::tx_type::stake },
        { "UNSTAKE",          bx::tx_type::unstake },
        { "DELEGATE",         bx::tx_type::delegate },
        { "UNDELEGATE",       bx::tx_type::undelegate },
        { "UPDATE_VALIDATOR", bx::tx_type::update_validator },
        { "UNJAIL",           bx::tx_type::unjail },
        { "COMPUTE",          bx::tx_type::compute },
        { "SUBMIT_RESULT",    bx::tx_type::submit_result },
    };

    for (const auto & m : names) {
        if (s == m.first) {
            return { true, m.second };
        }
    }

    return { false, bx::tx_type::transfer };
}

}

std::ostream & operator<<(std::ostream &os, const bx::transaction & tx)
{
    os
        << "hash:         " << tx.hash.decompress() << "\n"
        << "block_height: " << tx.block_height << "\n"
        << "tx_index:     " << tx.tx_index << "\n"
        << "type:         " << bx::to_string(tx.type) << "\n"
        << "from:         " << tx.from_address << "\n"
        << "to:           " << (tx.has_recipient() ? *tx.to_address : "-") << "\n"
        << "amount:       " << bx::to_string(tx.value) << "\n"
        << "fee:          " << bx::to_string(tx.fee) << "\n"
        << "nonce:        " << tx.nonce << "\n";

    return os;
}
