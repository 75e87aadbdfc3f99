#pragma once

#include "config.hpp"
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kvlimit
{

    struct PutOptions
    {
        /** Let the store drop the value on its own after this long. */
        std::optional<Duration> expiration_ttl;
    };

    /**
     * Key-value store holding window records, keyed by "<namespace>/<key>".
     *
     * The limiter assumes nothing beyond these three calls: no compare-and-swap,
     * no transactions, and possibly stale reads. Each call returns once the
     * operation finished or failed; transport failures come back as
     * StorageError and are never retried here.
     */
    class KvStore
    {
    public:
        virtual ~KvStore() = default;

        /** Value stored under key, or nullopt if there is none (or it expired). */
        virtual Result<std::optional<std::string>> get(std::string_view key) = 0;

        /** Overwrite the value under key unconditionally. */
        virtual Result<void> put(std::string_view key, std::string_view value, const PutOptions &options) = 0;

        /** Live keys starting with prefix, in ascending order. */
        virtual Result<std::vector<std::string>> list(std::string_view prefix) = 0;
    };

    /**
     * Process-local store. TTLs are applied lazily against the supplied clock,
     * which makes expiry testable with synthetic time.
     */
    class InMemoryKvStore : public KvStore
    {
    public:
        InMemoryKvStore();
        explicit InMemoryKvStore(Clock clock);

        Result<std::optional<std::string>> get(std::string_view key) override;
        Result<void> put(std::string_view key, std::string_view value, const PutOptions &options) override;
        Result<std::vector<std::string>> list(std::string_view prefix) override;

        /** Number of live entries. */
        std::size_t size() const;

    private:
        struct Entry
        {
            std::string value;
            std::optional<Timestamp> expires_at;
        };

        bool expired(const Entry &entry, Timestamp now) const;

        Clock clock_;
        mutable std::mutex mutex_;
        std::map<std::string, Entry, std::less<>> entries_;
    };

#ifdef KVLIMIT_HAVE_ROCKSDB
    /**
     * RocksDB-backed store. Each value carries an 8-byte big-endian expiry
     * (Unix seconds, 0 for none) in front of the payload; expired values read
     * as absent and are left for the next put to overwrite.
     */
    class RocksDbKvStore : public KvStore
    {
    public:
        /** @throws KvLimitError (StorageError) if the database cannot be opened */
        explicit RocksDbKvStore(const StorageConfig &cfg, Clock clock = system_now);
        ~RocksDbKvStore() override;

        Result<std::optional<std::string>> get(std::string_view key) override;
        Result<void> put(std::string_view key, std::string_view value, const PutOptions &options) override;
        Result<std::vector<std::string>> list(std::string_view prefix) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
#endif

} // namespace kvlimit
