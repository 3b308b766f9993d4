#pragma once

#include "storage/database.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace stark_sync {
namespace storage {

/**
 * CheckpointStore - last fully processed height under a fixed key
 *
 * The value is an 8-byte big-endian counter. The stored height never
 * regresses: save() refuses a lower value and advance() is a no-op unless
 * the new height is beyond the stored one.
 */
class CheckpointStore {
public:
    static constexpr const char* L1_KEY = "latestBlockSynced";
    static constexpr const char* L2_KEY = "latestStateUpdateSynced";

    explicit CheckpointStore(std::shared_ptr<Database> db, std::string key = L1_KEY);

    /**
     * @return 0 when no checkpoint was ever written, else the stored height
     * @throws PersistenceError if the stored value is not 8 bytes
     */
    uint64_t load() const;

    // nullopt when no checkpoint was ever written
    std::optional<uint64_t> try_load() const;

    /**
     * Persist `height`.
     *
     * @throws PersistenceError if the write is not confirmed
     * @throws std::logic_error if `height` is below the stored height
     */
    void save(uint64_t height);

    // Save only when nothing is stored or `height` is beyond the stored
    // height. Returns whether it wrote.
    bool advance(uint64_t height);

    const std::string& key() const { return key_; }

    static Bytes encode_height(uint64_t height);
    static uint64_t decode_height(const Bytes& value);

private:
    std::shared_ptr<Database> db_;
    std::string key_;
    mutable std::mutex mutex_;
};

} // namespace storage
} // namespace stark_sync
