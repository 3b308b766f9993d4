#pragma once

#include "feeder/types.hpp"
#include "storage/database.hpp"
#include "sync/fact_resolver.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace stark_sync {

/**
 * Stores - typed views over prefixed key spaces of the shared database
 *
 * Each store can stage its writes into a caller-owned batch so that one
 * block lands atomically together with its tree leaves. Reads go straight
 * to the database. Stored payloads that fail to decode raise
 * PersistenceError.
 *
 *   code/<address>          -> contract code, JSON text
 *   contract_hash/<address> -> contract hash, 32 bytes
 *   block/<hash>            -> block, CBOR
 *   block_number/<n>        -> block hash, 32 bytes
 *   tx/<hash>               -> transaction, CBOR
 *   page/<hash>             -> raw memory page data
 *   fact_pages/<fact>       -> concatenated 32-byte page hashes
 */

class CodeStore {
public:
    explicit CodeStore(std::shared_ptr<storage::Database> db);

    void stage(storage::Database::WriteBatch& batch, const FieldElement& address,
               const feeder::ContractCode& code) const;
    std::optional<feeder::ContractCode> get(const FieldElement& address) const;

private:
    std::shared_ptr<storage::PrefixedDatabase> db_;
};

class ContractHashStore {
public:
    explicit ContractHashStore(std::shared_ptr<storage::Database> db);

    void stage(storage::Database::WriteBatch& batch, const FieldElement& address,
               const FieldElement& contract_hash) const;
    std::optional<FieldElement> get(const FieldElement& address) const;

private:
    std::shared_ptr<storage::PrefixedDatabase> db_;
};

class BlockStore {
public:
    explicit BlockStore(std::shared_ptr<storage::Database> db);

    void stage_block(storage::Database::WriteBatch& batch, const feeder::FeederBlock& block) const;
    void stage_transaction(storage::Database::WriteBatch& batch, const feeder::FeederTransaction& tx) const;

    std::optional<feeder::FeederBlock> get_block(const FieldElement& block_hash) const;
    std::optional<feeder::FeederBlock> get_block_by_number(uint64_t block_number) const;
    std::optional<feeder::FeederTransaction> get_transaction(const FieldElement& tx_hash) const;

private:
    std::shared_ptr<storage::PrefixedDatabase> blocks_;
    std::shared_ptr<storage::PrefixedDatabase> numbers_;
    std::shared_ptr<storage::PrefixedDatabase> transactions_;
};

class MemoryPageStore {
public:
    explicit MemoryPageStore(std::shared_ptr<storage::Database> db);

    void stage(storage::Database::WriteBatch& batch, const ResolvedFact& fact) const;

    std::optional<Bytes> get_page(const Hash32& page_hash) const;
    std::optional<std::vector<Hash32>> get_fact_pages(const Hash32& fact) const;

private:
    std::shared_ptr<storage::PrefixedDatabase> pages_;
    std::shared_ptr<storage::PrefixedDatabase> facts_;
};

} // namespace stark_sync
