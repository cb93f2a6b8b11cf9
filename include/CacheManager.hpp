#pragma once

#include "SchemaProber.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>

namespace querymind {

// A single persisted snapshot with the time it was written
struct CacheEntry {
    Snapshot snapshot;
    std::chrono::system_clock::time_point cachedAt;
};

// File-backed cache holding at most one metadata snapshot.
//
// The file is a JSON envelope {format, version, cached_at, snapshot}.
// Entries older than the TTL, files with another format tag or version, and
// files that fail to parse all read as a miss. Writes go to a temporary file
// in the same directory which is then renamed over the cache file, so a
// reader never sees a half-written entry.
class CacheManager {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr const char* FORMAT_TAG = "querymind-metadata-cache";
    static constexpr int FORMAT_VERSION = 1;
    static constexpr std::chrono::seconds DEFAULT_TTL{3600};

    explicit CacheManager(std::filesystem::path file,
                          std::chrono::seconds ttl = DEFAULT_TTL,
                          Clock clock = {});
    ~CacheManager() = default;

    // Non-copyable
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Cached snapshot, or nullopt on any kind of miss
    std::optional<CacheEntry> get();

    // Replace the cached snapshot. Throws CacheError on I/O failure.
    void put(const Snapshot& snapshot);

    // Delete the cache file; a missing file is not an error
    void clear();

    const std::filesystem::path& file() const { return m_file; }
    std::chrono::seconds ttl() const { return m_ttl; }

private:
    std::chrono::system_clock::time_point now() const;
    std::filesystem::path temporaryPath() const;

    std::filesystem::path m_file;
    std::chrono::seconds m_ttl;
    Clock m_clock;

    mutable std::mutex m_mutex;
};

}  // namespace querymind
