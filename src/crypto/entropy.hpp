#pragma once

#include "core/result.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace sortid::crypto {

/**
 * EntropySource - Supplies random bytes for identifier construction.
 *
 * Implementations used from several threads must be safe for concurrent
 * calls. Errors are handed back to the caller of Ulid::generate unchanged.
 */
class EntropySource {
public:
    virtual ~EntropySource() = default;

    [[nodiscard]] virtual Result<std::vector<uint8_t>, Error> get_random_bytes(size_t count) = 0;
};

/**
 * Cryptographically secure bytes from libsodium's randombytes_buf.
 */
class SodiumEntropySource : public EntropySource {
public:
    Result<std::vector<uint8_t>, Error> get_random_bytes(size_t count) override;
};

/**
 * Fast, non-cryptographic bytes from a Mersenne Twister. A fixed seed makes
 * the output reproducible.
 */
class SimpleEntropySource : public EntropySource {
public:
    SimpleEntropySource();
    explicit SimpleEntropySource(uint64_t seed);

    Result<std::vector<uint8_t>, Error> get_random_bytes(size_t count) override;

private:
    std::mutex mu_;
    std::mt19937_64 gen_;
};

/**
 * Initialize libsodium. Safe to call repeatedly.
 */
[[nodiscard]] Result<void, Error> init();

/**
 * Create the backend named by SORTID_ENTROPY_BACKEND ("sodium" or "simple").
 * Unknown or unset values fall back to libsodium.
 */
[[nodiscard]] std::unique_ptr<EntropySource> create_entropy_source();

/**
 * The process-wide source used by Ulid::generate overloads that take none.
 * Created on first use and never replaced.
 */
[[nodiscard]] EntropySource& default_entropy_source();

} // namespace sortid::crypto
