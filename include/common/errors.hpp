#pragma once

#include <stdexcept>
#include <string>

namespace stark_sync {

/**
 * Error taxonomy of the synchronizer.
 *
 * TransportError   - L1 / feeder call failed. Retryable.
 * DecodeError      - malformed log or payload. The item is skipped.
 * CommitmentError  - Pedersen hashing failed. Fatal for the block being
 *                    materialized; halts the materializer.
 * PersistenceError - key-value or checkpoint write failed. Retryable; the
 *                    checkpoint is not advanced.
 * IngestionError   - backfill gave up after exhausting its retries.
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& what) : std::runtime_error(what) {}
};

class CommitmentError : public std::runtime_error {
public:
    explicit CommitmentError(const std::string& what) : std::runtime_error(what) {}
};

class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

class IngestionError : public std::runtime_error {
public:
    explicit IngestionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace stark_sync
