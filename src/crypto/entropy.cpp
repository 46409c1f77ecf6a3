#include "crypto/entropy.hpp"
#include "qt/logging.hpp"

#include <QDebug>
#include <QString>
#include <sodium.h>

namespace sortid::crypto {

namespace {

bool entropy_debug_enabled() {
    return qEnvironmentVariableIsSet("SORTID_DEBUG_ENTROPY");
}

} // namespace

Result<void, Error> init() {
    // sodium_init is idempotent; 1 means an earlier call already succeeded.
    static const int rc = sodium_init();
    if (rc < 0) {
        return Result<void, Error>::err(
            Error{ErrorCode::EntropyUnavailable, "Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

Result<std::vector<uint8_t>, Error> SodiumEntropySource::get_random_bytes(size_t count) {
    auto ready = init();
    if (ready.is_err()) {
        qCWarning(sortidEntropyLog) << "libsodium unavailable:"
                                    << QString::fromStdString(ready.unwrap_err().message);
        return Result<std::vector<uint8_t>, Error>::err(ready.unwrap_err());
    }
    std::vector<uint8_t> out(count);
    randombytes_buf(out.data(), out.size());
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

SimpleEntropySource::SimpleEntropySource()
    : gen_(std::random_device{}()) {}

SimpleEntropySource::SimpleEntropySource(uint64_t seed)
    : gen_(seed) {}

Result<std::vector<uint8_t>, Error> SimpleEntropySource::get_random_bytes(size_t count) {
    std::vector<uint8_t> out(count);
    std::lock_guard<std::mutex> lock(mu_);
    for (size_t i = 0; i < count; i += sizeof(uint64_t)) {
        auto word = gen_();
        for (size_t j = 0; j < sizeof(uint64_t) && i + j < count; ++j) {
            out[i + j] = static_cast<uint8_t>(word >> (j * 8));
        }
    }
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

std::unique_ptr<EntropySource> create_entropy_source() {
    const auto backend = qEnvironmentVariable("SORTID_ENTROPY_BACKEND").trimmed().toLower();

    if (backend == QStringLiteral("simple")) {
        bool ok = false;
        const auto seed = qEnvironmentVariable("SORTID_ENTROPY_SEED").trimmed().toULongLong(&ok);
        if (entropy_debug_enabled()) {
            qCInfo(sortidEntropyLog) << "using simple entropy backend"
                                     << (ok ? QStringLiteral("seed=%1").arg(seed)
                                            : QStringLiteral("random seed"));
        }
        if (ok) {
            return std::make_unique<SimpleEntropySource>(static_cast<uint64_t>(seed));
        }
        return std::make_unique<SimpleEntropySource>();
    }

    if (!backend.isEmpty() && backend != QStringLiteral("sodium")) {
        qCWarning(sortidEntropyLog) << "unknown SORTID_ENTROPY_BACKEND" << backend
                                    << "- falling back to libsodium";
    }
    if (entropy_debug_enabled()) {
        qCInfo(sortidEntropyLog) << "using libsodium entropy backend";
    }
    return std::make_unique<SodiumEntropySource>();
}

EntropySource& default_entropy_source() {
    static const std::unique_ptr<EntropySource> source = create_entropy_source();
    return *source;
}

} // namespace sortid::crypto
