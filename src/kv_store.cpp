#include "kvlimit/kv_store.hpp"

#ifdef KVLIMIT_HAVE_ROCKSDB
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#endif

namespace kvlimit
{

    InMemoryKvStore::InMemoryKvStore() : InMemoryKvStore(system_now) {}

    InMemoryKvStore::InMemoryKvStore(Clock clock) : clock_(std::move(clock)) {}

    bool InMemoryKvStore::expired(const Entry &entry, Timestamp now) const
    {
        return entry.expires_at && *entry.expires_at <= now;
    }

    Result<std::optional<std::string>> InMemoryKvStore::get(std::string_view key)
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::optional<std::string>{};
        if (expired(it->second, now))
        {
            entries_.erase(it);
            return std::optional<std::string>{};
        }
        return std::optional<std::string>(it->second.value);
    }

    Result<void> InMemoryKvStore::put(std::string_view key, std::string_view value, const PutOptions &options)
    {
        if (key.empty())
        {
            return std::unexpected(KvLimitError::invalid_input("Store key must not be empty"));
        }

        Entry entry{std::string(value), std::nullopt};
        if (options.expiration_ttl)
            entry.expires_at = clock_() + *options.expiration_ttl;

        std::lock_guard lock(mutex_);
        entries_.insert_or_assign(std::string(key), std::move(entry));
        return {};
    }

    Result<std::vector<std::string>> InMemoryKvStore::list(std::string_view prefix)
    {
        auto now = clock_();
        std::vector<std::string> out;
        std::lock_guard lock(mutex_);
        for (auto it = entries_.lower_bound(prefix); it != entries_.end(); ++it)
        {
            if (!it->first.starts_with(prefix))
                break;
            if (!expired(it->second, now))
                out.push_back(it->first);
        }
        return out;
    }

    std::size_t InMemoryKvStore::size() const
    {
        auto now = clock_();
        std::lock_guard lock(mutex_);
        std::size_t live = 0;
        for (const auto &[_, entry] : entries_)
        {
            if (!expired(entry, now))
                ++live;
        }
        return live;
    }

#ifdef KVLIMIT_HAVE_ROCKSDB
    namespace
    {
        constexpr std::size_t kExpiryHeaderSize = 8;

        std::string wrap_value(std::string_view payload, std::int64_t expires_at)
        {
            std::string out(kExpiryHeaderSize, '\0');
            auto bits = static_cast<std::uint64_t>(expires_at);
            for (std::size_t i = 0; i < kExpiryHeaderSize; ++i)
            {
                out[kExpiryHeaderSize - 1 - i] = static_cast<char>(bits & 0xFF);
                bits >>= 8;
            }
            out.append(payload);
            return out;
        }

        std::int64_t read_expiry(std::string_view stored)
        {
            std::uint64_t bits = 0;
            for (std::size_t i = 0; i < kExpiryHeaderSize; ++i)
                bits = (bits << 8) | static_cast<unsigned char>(stored[i]);
            return static_cast<std::int64_t>(bits);
        }
    } // namespace

    class RocksDbKvStore::Impl
    {
    public:
        Impl(const StorageConfig &cfg, Clock clock)
            : clock_(std::move(clock))
        {
            rocksdb::Options options;
            options.create_if_missing = true;
            auto status = rocksdb::DB::Open(options, cfg.rocksdb_path, &db);
            if (!status.ok())
            {
                throw KvLimitError::storage("RocksDB open failed: " + status.ToString());
            }
        }

        ~Impl()
        {
            delete db;
        }

        // Valid and not expired at now
        bool live(std::string_view stored, std::int64_t now) const
        {
            if (stored.size() < kExpiryHeaderSize)
                return false;
            auto expires_at = read_expiry(stored);
            return expires_at == 0 || expires_at > now;
        }

        Result<std::optional<std::string>> get(std::string_view key)
        {
            std::string stored;
            auto status = db->Get(rocksdb::ReadOptions(), rocksdb::Slice(key.data(), key.size()), &stored);
            if (status.IsNotFound())
                return std::optional<std::string>{};
            if (!status.ok())
            {
                return std::unexpected(KvLimitError::storage("RocksDB Get failed: " + status.ToString()));
            }
            if (!live(stored, to_unix_seconds(clock_())))
                return std::optional<std::string>{};
            return std::optional<std::string>(stored.substr(kExpiryHeaderSize));
        }

        Result<void> put(std::string_view key, std::string_view value, const PutOptions &options)
        {
            std::int64_t expires_at = 0;
            if (options.expiration_ttl)
                expires_at = to_unix_seconds(clock_() + *options.expiration_ttl);

            auto stored = wrap_value(value, expires_at);
            auto status = db->Put(rocksdb::WriteOptions(), rocksdb::Slice(key.data(), key.size()), stored);
            if (!status.ok())
            {
                return std::unexpected(KvLimitError::storage("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

        Result<std::vector<std::string>> list(std::string_view prefix)
        {
            auto now = to_unix_seconds(clock_());
            std::vector<std::string> out;
            std::unique_ptr<rocksdb::Iterator> it(db->NewIterator(rocksdb::ReadOptions()));
            for (it->Seek(rocksdb::Slice(prefix.data(), prefix.size())); it->Valid(); it->Next())
            {
                std::string_view key(it->key().data(), it->key().size());
                if (!key.starts_with(prefix))
                    break;
                if (live(std::string_view(it->value().data(), it->value().size()), now))
                    out.emplace_back(key);
            }
            if (!it->status().ok())
            {
                return std::unexpected(KvLimitError::storage("RocksDB iteration failed: " + it->status().ToString()));
            }
            return out;
        }

    private:
        rocksdb::DB *db{nullptr};
        Clock clock_;
    };

    RocksDbKvStore::RocksDbKvStore(const StorageConfig &cfg, Clock clock)
        : impl_(std::make_unique<Impl>(cfg, std::move(clock))) {}

    RocksDbKvStore::~RocksDbKvStore() = default;

    Result<std::optional<std::string>> RocksDbKvStore::get(std::string_view key)
    {
        return impl_->get(key);
    }

    Result<void> RocksDbKvStore::put(std::string_view key, std::string_view value, const PutOptions &options)
    {
        return impl_->put(key, value, options);
    }

    Result<std::vector<std::string>> RocksDbKvStore::list(std::string_view prefix)
    {
        return impl_->list(prefix);
    }
#endif // KVLIMIT_HAVE_ROCKSDB

} // namespace kvlimit
