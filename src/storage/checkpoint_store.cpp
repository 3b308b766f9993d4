#include "storage/checkpoint_store.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include <iostream>
#include <stdexcept>

namespace stark_sync {
namespace storage {

namespace {

std::optional<uint64_t> load_unlocked(Database& db, const std::string& key) {
    auto value = db.get(to_key(key));
    if (!value) {
        return std::nullopt;
    }
    return CheckpointStore::decode_height(*value);
}

} // namespace

CheckpointStore::CheckpointStore(std::shared_ptr<Database> db, std::string key)
    : db_(std::move(db)), key_(std::move(key)) {
    if (!db_) {
        throw std::invalid_argument("CheckpointStore requires a database");
    }
}

Bytes CheckpointStore::encode_height(uint64_t height) {
    Bytes out(8);
    for (int i = 7; i >= 0; --i) {
        out[static_cast<size_t>(i)] = static_cast<uint8_t>(height & 0xFF);
        height >>= 8;
    }
    return out;
}

uint64_t CheckpointStore::decode_height(const Bytes& value) {
    if (value.size() != 8) {
        throw PersistenceError("Corrupt checkpoint: expected 8 bytes, got " +
                               std::to_string(value.size()));
    }
    uint64_t height = 0;
    for (uint8_t b : value) {
        height = (height << 8) | b;
    }
    return height;
}

uint64_t CheckpointStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked(*db_, key_).value_or(0);
}

std::optional<uint64_t> CheckpointStore::try_load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_unlocked(*db_, key_);
}

void CheckpointStore::save(uint64_t height) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t current = load_unlocked(*db_, key_).value_or(0);
    if (height < current) {
        throw std::logic_error("Checkpoint regression key=" + key_ + " stored=" +
                               std::to_string(current) + " requested=" + std::to_string(height));
    }
    if (!db_->put(to_key(key_), encode_height(height))) {
        throw PersistenceError("Failed to write checkpoint key=" + key_ +
                               " height=" + std::to_string(height));
    }
    STARK_SYNC_DEBUG_COUT("[checkpoint] Saved key=" << key_ << " height=" << height << std::endl);
}

bool CheckpointStore::advance(uint64_t height) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stored = load_unlocked(*db_, key_);
    if (stored && height <= *stored) {
        return false;
    }
    uint64_t current = stored.value_or(0);
    if (!db_->put(to_key(key_), encode_height(height))) {
        throw PersistenceError("Failed to write checkpoint key=" + key_ +
                               " height=" + std::to_string(height));
    }
    STARK_SYNC_DEBUG_COUT("[checkpoint] Advanced key=" << key_ << " from=" << current
                          << " to=" << height << std::endl);
    return true;
}

} // namespace storage
} // namespace stark_sync
