#include <memory>
#include <vector>
#include <string>
#include <cstdint>
#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/string/to_string.hpp>
#include <bsoncxx/exception/exception.hpp>
#include <bsoncxx/types.hpp>
#include <mongocxx/client.hpp>
#include <mongocxx/options/find.hpp>
#include <mongocxx/options/replace.hpp>
#include <mongocxx/options/transaction.hpp>
#include <mongocxx/read_concern.hpp>
#include <mongocxx/database.hpp>
#include <mongocxx/exception/exception.hpp>
#include <spdlog/spdlog.h>
#include <bx++/error.hpp>
#include <bx++/mdatabase.hpp>

namespace bx {

namespace {

using bsoncxx::builder::basic::make_document;
using bsoncxx::builder::basic::kvp;

// every driver failure becomes a store_error so callers can retry the cycle
template <typename F>
auto guarded(const char * what, F f) -> decltype(f())
{
    try {
        return f();
    } catch (const mongocxx::exception& e) {
        spdlog::warn("mdatabase: {} failed: {}", what, e.what());
        throw bx::store_error(std::string(what) + ": " + e.what());
    } catch (const bsoncxx::exception& e) {
        spdlog::warn("mdatabase: {} failed: {}", what, e.what());
        throw bx::store_error(std::string(what) + ": " + e.what());
    }
}

std::string get_str(const bsoncxx::document::view& doc, const char * key)
{
    const auto el = doc[key];
    if (! el || el.type() != bsoncxx::type::k_utf8) {
        throw bx::store_error(std::string("malformed document, expected string ") + key);
    }

    return bsoncxx::string::to_string(el.get_utf8().value);
}

std::optional<std::string> get_opt_str(const bsoncxx::document::view& doc, const char * key)
{
    const auto el = doc[key];
    if (! el || el.type() == bsoncxx::type::k_null) {
        return std::nullopt;
    }

    return get_str(doc, key);
}

std::int64_t get_int(const bsoncxx::document::view& doc, const char * key)
{
    const auto el = doc[key];
    if (el && el.type() == bsoncxx::type::k_int64) {
        return el.get_int64().value;
    }
    if (el && el.type() == bsoncxx::type::k_int32) {
        return el.get_int32().value;
    }

    throw bx::store_error(std::string("malformed document, expected integer ") + key);
}

std::optional<std::uint64_t> get_opt_u64(const bsoncxx::document::view& doc, const char * key)
{
    const auto el = doc[key];
    if (! el || el.type() == bsoncxx::type::k_null) {
        return std::nullopt;
    }

    return static_cast<std::uint64_t>(get_int(doc, key));
}

bool get_bool(const bsoncxx::document::view& doc, const char * key)
{
    const auto el = doc[key];
    if (! el || el.type() != bsoncxx::type::k_bool) {
        throw bx::store_error(std::string("malformed document, expected bool ") + key);
    }

    return el.get_bool().value;
}

// amounts are stored as base-10 strings, bson has no unbounded integer
bx::amount get_amount(const bsoncxx::document::view& doc, const char * key)
{
    const std::pair<bool, bx::amount> a = bx::parse_amount(get_str(doc, key));
    if (! a.first) {
        throw bx::store_error(std::string("malformed document, bad amount ") + key);
    }

    return a.second;
}

template <typename Hash>
Hash get_hash(const bsoncxx::document::view& doc, const char * key)
{
    const std::pair<bool, Hash> h = Hash::from_hex(get_str(doc, key));
    if (! h.first) {
        throw bx::store_error(std::string("malformed document, bad hash ") + key);
    }

    return h.second;
}

template <typename T>
void append_optional(
    bsoncxx::builder::basic::document & doc,
    const char *                        key,
    const std::optional<T>&             v
) {
    if (v.has_value()) {
        doc.append(kvp(key, static_cast<std::int64_t>(*v)));
    } else {
        doc.append(kvp(key, bsoncxx::types::b_null{}));
    }
}

bsoncxx::document::value block_to_document(const bx::block& block)
{
    return make_document(
        kvp("height",           static_cast<std::int64_t>(block.height)),
        kvp("hash",             block.hash.decompress()),
        kvp("prev_hash",        block.prev_hash.decompress()),
        kvp("timestamp",        block.timestamp),
        kvp("chain_id",         block.chain_id),
        kvp("proposer_address", block.proposer_address),
        kvp("tx_root",          block.tx_root),
        kvp("state_root",       block.state_root),
        kvp("gas_used",         static_cast<std::int64_t>(block.gas_used)),
        kvp("gas_limit",        static_cast<std::int64_t>(block.gas_limit)),
        kvp("tx_count",         static_cast<std::int64_t>(block.tx_count))
    );
}

bx::block block_from_document(const bsoncxx::document::view& doc)
{
    bx::block block;
    block.height           = static_cast<std::uint64_t>(get_int(doc, "height"));
    block.hash             = get_hash<bx::blockhash>(doc, "hash");
    block.prev_hash        = get_hash<bx::blockhash>(doc, "prev_hash");
    block.timestamp        = get_int(doc, "timestamp");
    block.chain_id         = get_str(doc, "chain_id");
    block.proposer_address = get_str(doc, "proposer_address");
    block.tx_root          = get_str(doc, "tx_root");
    block.state_root       = get_str(doc, "state_root");
    block.gas_used         = static_cast<std::uint64_t>(get_int(doc, "gas_used"));
    block.gas_limit        = static_cast<std::uint64_t>(get_int(doc, "gas_limit"));
    block.tx_count         = static_cast<std::uint32_t>(get_int(doc, "tx_count"));
    return block;
}

bsoncxx::document::value transaction_to_document(const bx::transaction& tx)
{
    bsoncxx::builder::basic::document doc{};
    doc.append(
        kvp("hash",         tx.hash.decompress()),
        kvp("block_height", static_cast<std::int64_t>(tx.block_height)),
        kvp("tx_index",     static_cast<std::int64_t>(tx.tx_index)),
        kvp("tx_type",      bx::to_string(tx.type)),
        kvp("from_address", tx.from_address)
    );

    if (tx.has_recipient()) {
        doc.append(kvp("to_address", *tx.to_address));
    } else {
        doc.append(kvp("to_address", bsoncxx::types::b_null{}));
    }

    doc.append(
        kvp("value",     bx::to_string(tx.value)),
        kvp("fee",       bx::to_string(tx.fee)),
        kvp("nonce",     static_cast<std::int64_t>(tx.nonce)),
        kvp("gas_price", static_cast<std::int64_t>(tx.gas_price)),
        kvp("gas_limit", static_cast<std::int64_t>(tx.gas_limit)),
        kvp("gas_used",  static_cast<std::int64_t>(tx.gas_used)),
        kvp("signature", tx.signature),
        kvp("pub_key",   tx.pub_key),
        kvp("payload",   tx.payload)
    );

    return doc.extract();
}

bx::transaction transaction_from_document(const bsoncxx::document::view& doc)
{
    bx::transaction tx;
    tx.hash         = get_hash<bx::txhash>(doc, "hash");
    tx.block_height = static_cast<std::uint64_t>(get_int(doc, "block_height"));
    tx.tx_index     = static_cast<std::uint32_t>(get_int(doc, "tx_index"));

    const std::pair<bool, bx::tx_type> type = bx::tx_type_from_string(get_str(doc, "tx_type"));
    if (! type.first) {
        throw bx::store_error("malformed document, unknown tx_type");
    }
    tx.type = type.second;

    tx.from_address = get_str(doc, "from_address");
    tx.to_address   = get_opt_str(doc, "to_address");
    tx.value        = get_amount(doc, "value");
    tx.fee          = get_amount(doc, "fee");
    tx.nonce        = static_cast<std::uint64_t>(get_int(doc, "nonce"));
    tx.gas_price    = static_cast<std::uint64_t>(get_int(doc, "gas_price"));
    tx.gas_limit    = static_cast<std::uint64_t>(get_int(doc, "gas_limit"));
    tx.gas_used     = static_cast<std::uint64_t>(get_int(doc, "gas_used"));
    tx.signature    = get_str(doc, "signature");
    tx.pub_key      = get_str(doc, "pub_key");
    tx.payload      = get_str(doc, "payload");
    return tx;
}

bsoncxx::document::value account_to_document(const bx::account& acc)
{
    bsoncxx::builder::basic::document doc{};
    doc.append(
        kvp("address",           acc.address),
        kvp("balance",           bx::to_string(acc.balance)),
        kvp("nonce",             static_cast<std::int64_t>(acc.nonce)),
        kvp("tx_count",          static_cast<std::int64_t>(acc.tx_count)),
        kvp("tx_sent_count",     static_cast<std::int64_t>(acc.tx_sent_count)),
        kvp("tx_received_count", static_cast<std::int64_t>(acc.tx_received_count)),
        kvp("is_validator",      acc.is_validator)
    );
    append_optional(doc, "first_seen_height", acc.first_seen_height);
    append_optional(doc, "last_seen_height",  acc.last_seen_height);

    return doc.extract();
}

bx::account account_from_document(const bsoncxx::document::view& doc)
{
    bx::account acc(get_str(doc, "address"));
    acc.balance           = get_amount(doc, "balance");
    acc.nonce             = static_cast<std::uint64_t>(get_int(doc, "nonce"));
    acc.tx_count          = static_cast<std::uint64_t>(get_int(doc, "tx_count"));
    acc.tx_sent_count     = static_cast<std::uint64_t>(get_int(doc, "tx_sent_count"));
    acc.tx_received_count = static_cast<std::uint64_t>(get_int(doc, "tx_received_count"));
    acc.first_seen_height = get_opt_u64(doc, "first_seen_height");
    acc.last_seen_height  = get_opt_u64(doc, "last_seen_height");
    acc.is_validator      = get_bool(doc, "is_validator");
    return acc;
}

bx::sync_state sync_state_from_document(const bsoncxx::document::view& doc)
{
    bx::sync_state sync;
    sync.indexed_height = get_int(doc, "indexed_height");
    sync.tip_hash       = get_hash<bx::blockhash>(doc, "tip_hash");
    sync.last_poll      = get_int(doc, "last_poll");
    return sync;
}

bx::chain_totals totals_from_document(const bsoncxx::document::view& doc)
{
    bx::chain_totals totals;
    totals.fees         = get_amount(doc, "fees");
    totals.transferred  = get_amount(doc, "transferred");
    totals.bonded       = get_amount(doc, "bonded");
    totals.blocks       = static_cast<std::uint64_t>(get_int(doc, "blocks"));
    totals.transactions = static_cast<std::uint64_t>(get_int(doc, "transactions"));
    return totals;
}

bx::reorg_event reorg_event_from_document(const bsoncxx::document::view& doc)
{
    bx::reorg_event event;
    event.height          = static_cast<std::uint64_t>(get_int(doc, "height"));
    event.old_hash        = get_hash<bx::blockhash>(doc, "old_hash");
    event.new_hash        = get_hash<bx::blockhash>(doc, "new_hash");
    event.blocks_reverted = static_cast<std::uint64_t>(get_int(doc, "blocks_reverted"));
    event.detected_at     = get_int(doc, "detected_at");
    return event;
}

// block document plus its transaction documents, read through one session
std::optional<bx::block> load_block(
    mongocxx::database&       db,
    mongocxx::client_session& session,
    const std::uint64_t       height
) {
    const auto doc = db["blocks"].find_one(
        session,
        make_document(kvp("height", static_cast<std::int64_t>(height)))
    );
    if (! doc) {
        return std::nullopt;
    }

    bx::block block = block_from_document(doc->view());

    mongocxx::options::find opts{};
    opts.sort(make_document(kvp("tx_index", 1)));

    auto cursor = db["transactions"].find(
        session,
        make_document(kvp("block_height", static_cast<std::int64_t>(height))),
        opts
    );
    for (auto&& tx_doc : cursor) {
        block.txs.push_back(transaction_from_document(tx_doc));
    }

    return block;
}

mongocxx::options::replace upsert()
{
    mongocxx::options::replace opts{};
    opts.upsert(true);
    return opts;
}

}


void mdatabase::create_indexes()
{
    guarded("create_indexes", [&] {
        auto client = pool.acquire();
        auto db = (*client)[db_name];

        const auto unique = make_document(kvp("unique", true));

        db["blocks"].create_index(make_document(kvp("height", 1)), unique.view());
        db["blocks"].create_index(make_document(kvp("hash", 1)), unique.view());
        db["blocks"].create_index(make_document(kvp("timestamp", 1)));

        db["transactions"].create_index(make_document(kvp("hash", 1)), unique.view());
        db["transactions"].create_index(make_document(kvp("block_height", 1), kvp("tx_index", 1)));
        db["transactions"].create_index(make_document(kvp("from_address", 1), kvp("block_height", -1)));
        db["transactions"].create_index(make_document(kvp("to_address", 1), kvp("block_height", -1)));

        db["accounts"].create_index(make_document(kvp("address", 1)), unique.view());

        db["reorg_events"].create_index(make_document(kvp("detected_at", -1)));

        spdlog::info("mdatabase: indexes ready on {}", db_name);
    });
}

std::unique_ptr<bx::store_txn> mdatabase::begin()
{
    return guarded("begin", [&] () -> std::unique_ptr<bx::store_txn> {
        return std::make_unique<bx::mdatabase_txn>(pool, db_name);
    });
}

bx::sync_state mdatabase::get_sync_state()
{
    return guarded("get_sync_state", [&] {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["sync_state"];

        const auto doc = collection.find_one(make_document(kvp("_id", "sync")));
        if (! doc) {
            return bx::sync_state();
        }

        return sync_state_from_document(doc->view());
    });
}

bx::chain_totals mdatabase::get_totals()
{
    return guarded("get_totals", [&] {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["totals"];

        const auto doc = collection.find_one(make_document(kvp("_id", "totals")));
        if (! doc) {
            return bx::chain_totals();
        }

        return totals_from_document(doc->view());
    });
}

std::optional<bx::blockhash> mdatabase::get_block_hash(const std::uint64_t height)
{
    return guarded("get_block_hash", [&] () -> std::optional<bx::blockhash> {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["blocks"];

        mongocxx::options::find opts{};
        opts.projection(make_document(kvp("hash", 1)));

        const auto doc = collection.find_one(
            make_document(kvp("height", static_cast<std::int64_t>(height))),
            opts
        );
        if (! doc) {
            return std::nullopt;
        }

        return get_hash<bx::blockhash>(doc->view(), "hash");
    });
}

std::optional<bx::block> mdatabase::get_block(const std::uint64_t height)
{
    return guarded("get_block", [&] () -> std::optional<bx::block> {
        auto client = pool.acquire();
        auto db = (*client)[db_name];

        // both finds see the same snapshot, so a block never comes back
        // without the transactions committed alongside it
        mongocxx::read_concern snapshot{};
        snapshot.acknowledge_level(mongocxx::read_concern::level::k_snapshot);
        mongocxx::options::transaction opts{};
        opts.read_concern(snapshot);

        auto session = client->start_session();
        session.start_transaction(opts);

        std::optional<bx::block> block = load_block(db, session, height);
        session.commit_transaction();

        return block;
    });
}

std::optional<bx::account> mdatabase::get_account(const std::string& address)
{
    return guarded("get_account", [&] () -> std::optional<bx::account> {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["accounts"];

        const auto doc = collection.find_one(make_document(kvp("address", address)));
        if (! doc) {
            return std::nullopt;
        }

        return account_from_document(doc->view());
    });
}

std::vector<bx::block> mdatabase::get_blocks_since(const std::int64_t since)
{
    return guarded("get_blocks_since", [&] {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["blocks"];

        mongocxx::options::find opts{};
        opts.sort(make_document(kvp("height", 1)));

        std::vector<bx::block> ret;
        auto cursor = collection.find(
            make_document(kvp("timestamp", make_document(kvp("$gte", since)))),
            opts
        );
        for (auto&& doc : cursor) {
            ret.push_back(block_from_document(doc));
        }

        return ret;
    });
}

std::vector<bx::reorg_event> mdatabase::get_reorg_events(const std::size_t limit)
{
    return guarded("get_reorg_events", [&] {
        auto client = pool.acquire();
        auto collection = (*client)[db_name]["reorg_events"];

        mongocxx::options::find opts{};
        opts.sort(make_document(kvp("detected_at", -1), kvp("_id", -1)));
        opts.limit(static_cast<std::int64_t>(limit));

        std::vector<bx::reorg_event> ret;
        auto cursor = collection.find({}, opts);
        for (auto&& doc : cursor) {
            ret.push_back(reorg_event_from_document(doc));
        }

        return ret;
    });
}


mdatabase_txn::mdatabase_txn(
    mongocxx::pool&    pool,
    const std::string& db_name
)
: db_name(db_name)
, client(pool.acquire())
, session(client->start_session())
{
    // an uncommitted transaction is aborted when session is destroyed
    session.start_transaction();
}

bx::sync_state mdatabase_txn::get_sync_state()
{
    return guarded("txn get_sync_state", [&] {
        auto collection = (*client)[db_name]["sync_state"];

        const auto doc = collection.find_one(session, make_document(kvp("_id", "sync")));
        if (! doc) {
            return bx::sync_state();
        }

        return sync_state_from_document(doc->view());
    });
}

void mdatabase_txn::put_sync_state(const bx::sync_state& state)
{
    guarded("txn put_sync_state", [&] {
        auto collection = (*client)[db_name]["sync_state"];

        collection.replace_one(
            session,
            make_document(kvp("_id", "sync")),
            make_document(
                kvp("_id",            "sync"),
                kvp("indexed_height", state.indexed_height),
                kvp("tip_hash",       state.tip_hash.decompress()),
                kvp("last_poll",      state.last_poll)
            ),
            upsert()
        );
    });
}

bx::chain_totals mdatabase_txn::get_totals()
{
    return guarded("txn get_totals", [&] {
        auto collection = (*client)[db_name]["totals"];

        const auto doc = collection.find_one(session, make_document(kvp("_id", "totals")));
        if (! doc) {
            return bx::chain_totals();
        }

        return totals_from_document(doc->view());
    });
}

void mdatabase_txn::put_totals(const bx::chain_totals& totals)
{
    guarded("txn put_totals", [&] {
        auto collection = (*client)[db_name]["totals"];

        collection.replace_one(
            session,
            make_document(kvp("_id", "totals")),
            make_document(
                kvp("_id",          "totals"),
                kvp("fees",         bx::to_string(totals.fees)),
                kvp("transferred",  bx::to_string(totals.transferred)),
                kvp("bonded",       bx::to_string(totals.bonded)),
                kvp("blocks",       static_cast<std::int64_t>(totals.blocks)),
                kvp("transactions", static_cast<std::int64_t>(totals.transactions))
            ),
            upsert()
        );
    });
}

std::optional<bx::block> mdatabase_txn::get_block(const std::uint64_t height)
{
    return guarded("txn get_block", [&] {
        auto db = (*client)[db_name];
        return load_block(db, session, height);
    });
}

void mdatabase_txn::insert_block(const bx::block& block)
{
    guarded("txn insert_block", [&] {
        auto db = (*client)[db_name];

        db["blocks"].insert_one(session, block_to_document(block).view());

        if (block.txs.empty()) {
            return;
        }

        std::vector<bsoncxx::document::value> docs;
        docs.reserve(block.txs.size());
        for (const bx::transaction & tx : block.txs) {
            docs.push_back(transaction_to_document(tx));
        }

        db["transactions"].insert_many(session, docs);
    });
}

void mdatabase_txn::delete_block(const std::uint64_t height)
{
    guarded("txn delete_block", [&] {
        auto db = (*client)[db_name];

        db["transactions"].delete_many(
            session,
            make_document(kvp("block_height", static_cast<std::int64_t>(height)))
        );
        db["blocks"].delete_one(
            session,
            make_document(kvp("height", static_cast<std::int64_t>(height)))
        );
    });
}

std::optional<bx::account> mdatabase_txn::get_account(const std::string& address)
{
    return guarded("txn get_account", [&] () -> std::optional<bx::account> {
        auto collection = (*client)[db_name]["accounts"];

        const auto doc = collection.find_one(session, make_document(kvp("address", address)));
        if (! doc) {
            return std::nullopt;
        }

        return account_from_document(doc->view());
    });
}

void mdatabase_txn::put_account(const bx::account& acc)
{
    guarded("txn put_account", [&] {
        auto collection = (*client)[db_name]["accounts"];

        collection.replace_one(
            session,
            make_document(kvp("address", acc.address)),
            account_to_document(acc).view(),
            upsert()
        );
    });
}

bx::account_history mdatabase_txn::get_account_history(
    const std::string&  address,
    const std::uint64_t below_height
) {
    return guarded("txn get_account_history", [&] {
        auto collection = (*client)[db_name]["transactions"];
        const auto below = make_document(kvp("$lt", static_cast<std::int64_t>(below_height)));

        bx::account_history ret;

        {
            mongocxx::options::find opts{};
            opts.sort(make_document(kvp("block_height", -1)));

            const auto doc = collection.find_one(
                session,
                make_document(
                    kvp("block_height", below.view()),
                    kvp("$or", [&](bsoncxx::builder::basic::sub_array arr) {
                        arr.append(make_document(kvp("from_address", address)));
                        arr.append(make_document(kvp("to_address", address)));
                    })
                ),
                opts
            );
            if (doc) {
                ret.last_seen_height = static_cast<std::uint64_t>(get_int(doc->view(), "block_height"));
            }
        }

        {
            mongocxx::options::find opts{};
            opts.sort(make_document(kvp("nonce", -1)));

            const auto doc = collection.find_one(
                session,
                make_document(
                    kvp("from_address", address),
                    kvp("block_height", below.view())
                ),
                opts
            );
            if (doc) {
                ret.next_nonce = static_cast<std::uint64_t>(get_int(doc->view(), "nonce")) + 1;
            }
        }

        {
            const auto doc = collection.find_one(
                session,
                make_document(
                    kvp("from_address", address),
                    kvp("tx_type", bx::to_string(bx::tx_type::stake)),
                    kvp("block_height", below.view())
                )
            );
            ret.is_validator = static_cast<bool>(doc);
        }

        return ret;
    });
}

void mdatabase_txn::insert_reorg_event(const bx::reorg_event& event)
{
    guarded("txn insert_reorg_event", [&] {
        auto collection = (*client)[db_name]["reorg_events"];

        collection.insert_one(session, make_document(
            kvp("height",          static_cast<std::int64_t>(event.height)),
            kvp("old_hash",        event.old_hash.decompress()),
            kvp("new_hash",        event.new_hash.decompress()),
            kvp("blocks_reverted", static_cast<std::int64_t>(event.blocks_reverted)),
            kvp("detected_at",     event.detected_at)
        ));
    });
}

void mdatabase_txn::commit()
{
    guarded("txn commit", [&] {
        session.commit_transaction();
    });
}

}
