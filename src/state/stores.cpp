#include "state/stores.hpp"
#include "common/errors.hpp"
#include "feeder/json_codec.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>

namespace stark_sync {

namespace {

Bytes felt_key(const FieldElement& value) {
    auto bytes = value.to_bytes_be();
    return Bytes(bytes.begin(), bytes.end());
}

Bytes hash_key(const Hash32& value) {
    return Bytes(value.bytes().begin(), value.bytes().end());
}

Bytes number_key(uint64_t value) {
    Bytes out(8);
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return out;
}

FieldElement decode_felt(const Bytes& value, const char* what) {
    if (value.size() != FieldElement::NUM_BYTES) {
        throw PersistenceError(std::string("Corrupt ") + what + ": expected 32 bytes, got " +
                               std::to_string(value.size()));
    }
    FieldElement::Bytes32 bytes;
    std::copy(value.begin(), value.end(), bytes.begin());
    try {
        return FieldElement::from_bytes_be(bytes);
    } catch (const std::invalid_argument& e) {
        throw PersistenceError(std::string("Corrupt ") + what + ": " + e.what());
    }
}

template <typename T, typename Parse>
T decode_cbor(const Bytes& value, const char* what, Parse parse) {
    try {
        return parse(nlohmann::json::from_cbor(value));
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError(std::string("Corrupt ") + what + ": " + e.what());
    } catch (const DecodeError& e) {
        throw PersistenceError(std::string("Corrupt ") + what + ": " + e.what());
    }
}

} // namespace

// ---------------------------------------------------------------------------
// CodeStore

CodeStore::CodeStore(std::shared_ptr<storage::Database> db)
    : db_(std::make_shared<storage::PrefixedDatabase>(std::move(db), "code/")) {}

void CodeStore::stage(storage::Database::WriteBatch& batch, const FieldElement& address,
                      const feeder::ContractCode& code) const {
    batch.put(db_->full_key(felt_key(address)), storage::to_key(feeder::code_to_json(code).dump()));
}

std::optional<feeder::ContractCode> CodeStore::get(const FieldElement& address) const {
    auto value = db_->get(felt_key(address));
    if (!value) {
        return std::nullopt;
    }
    try {
        return feeder::parse_code(nlohmann::json::parse(storage::key_to_string(*value)));
    } catch (const nlohmann::json::exception& e) {
        throw PersistenceError("Corrupt code address=0x" + address.to_hex() + ": " + e.what());
    } catch (const DecodeError& e) {
        throw PersistenceError("Corrupt code address=0x" + address.to_hex() + ": " + e.what());
    }
}

// ---------------------------------------------------------------------------
// ContractHashStore

ContractHashStore::ContractHashStore(std::shared_ptr<storage::Database> db)
    : db_(std::make_shared<storage::PrefixedDatabase>(std::move(db), "contract_hash/")) {}

void ContractHashStore::stage(storage::Database::WriteBatch& batch, const FieldElement& address,
                              const FieldElement& contract_hash) const {
    batch.put(db_->full_key(felt_key(address)), felt_key(contract_hash));
}

std::optional<FieldElement> ContractHashStore::get(const FieldElement& address) const {
    auto value = db_->get(felt_key(address));
    if (!value) {
        return std::nullopt;
    }
    return decode_felt(*value, "contract hash");
}

// ---------------------------------------------------------------------------
// BlockStore

BlockStore::BlockStore(std::shared_ptr<storage::Database> db)
    : blocks_(std::make_shared<storage::PrefixedDatabase>(db, "block/")),
      numbers_(std::make_shared<storage::PrefixedDatabase>(db, "block_number/")),
      transactions_(std::make_shared<storage::PrefixedDatabase>(db, "tx/")) {}

void BlockStore::stage_block(storage::Database::WriteBatch& batch, const feeder::FeederBlock& block) const {
    batch.put(blocks_->full_key(felt_key(block.block_hash)),
              nlohmann::json::to_cbor(feeder::block_to_json(block)));
    batch.put(numbers_->full_key(number_key(block.block_number)), felt_key(block.block_hash));
}

void BlockStore::stage_transaction(storage::Database::WriteBatch& batch,
                                   const feeder::FeederTransaction& tx) const {
    batch.put(transactions_->full_key(felt_key(tx.hash)),
              nlohmann::json::to_cbor(feeder::transaction_to_json(tx)));
}

std::optional<feeder::FeederBlock> BlockStore::get_block(const FieldElement& block_hash) const {
    auto value = blocks_->get(felt_key(block_hash));
    if (!value) {
        return std::nullopt;
    }
    return decode_cbor<feeder::FeederBlock>(*value, "block", [](const nlohmann::json& j) {
        return feeder::parse_block(j);
    });
}

std::optional<feeder::FeederBlock> BlockStore::get_block_by_number(uint64_t block_number) const {
    auto hash = numbers_->get(number_key(block_number));
    if (!hash) {
        return std::nullopt;
    }
    return get_block(decode_felt(*hash, "block number index"));
}

std::optional<feeder::FeederTransaction> BlockStore::get_transaction(const FieldElement& tx_hash) const {
    auto value = transactions_->get(felt_key(tx_hash));
    if (!value) {
        return std::nullopt;
    }
    return decode_cbor<feeder::FeederTransaction>(*value, "transaction", [](const nlohmann::json& j) {
        return feeder::parse_transaction(j);
    });
}

// ---------------------------------------------------------------------------
// MemoryPageStore

MemoryPageStore::MemoryPageStore(std::shared_ptr<storage::Database> db)
    : pages_(std::make_shared<storage::PrefixedDatabase>(db, "page/")),
      facts_(std::make_shared<storage::PrefixedDatabase>(db, "fact_pages/")) {}

void MemoryPageStore::stage(storage::Database::WriteBatch& batch, const ResolvedFact& fact) const {
    Bytes page_list;
    page_list.reserve(fact.pages.size() * Hash32::LEN);
    for (const auto& page : fact.pages) {
        batch.put(pages_->full_key(hash_key(page.page_hash)), page.data);
        page_list.insert(page_list.end(), page.page_hash.bytes().begin(), page.page_hash.bytes().end());
    }
    batch.put(facts_->full_key(hash_key(fact.fact)), std::move(page_list));
}

std::optional<Bytes> MemoryPageStore::get_page(const Hash32& page_hash) const {
    return pages_->get(hash_key(page_hash));
}

std::optional<std::vector<Hash32>> MemoryPageStore::get_fact_pages(const Hash32& fact) const {
    auto value = facts_->get(hash_key(fact));
    if (!value) {
        return std::nullopt;
    }
    if (value->size() % Hash32::LEN != 0) {
        throw PersistenceError("Corrupt page list fact=" + fact.to_hex() + " size=" +
                               std::to_string(value->size()));
    }
    std::vector<Hash32> pages;
    for (size_t offset = 0; offset < value->size(); offset += Hash32::LEN) {
        pages.push_back(Hash32::from_bytes(value->data() + offset, Hash32::LEN));
    }
    return pages;
}

} // namespace stark_sync
