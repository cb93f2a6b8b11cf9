#pragma once

#include "CacheManager.hpp"
#include "SchemaProber.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace querymind {

struct ExtractOptions {
    bool includeSamples = true;
    int sampleRows = 3;
    bool includeStatistics = true;
    bool useCache = true;
};

// Drives a SchemaProber over every table and view and assembles a Snapshot.
//
// With useCache set, a cached snapshot is returned as-is, whatever the
// inclusion flags say; a fresh extraction is written back to the cache.
// Per-relation probe failures never escape: the affected part degrades to
// empty or absent and a ProbeWarning is recorded on the snapshot. Only a
// failed connection or a failed table/view listing ends the extraction
// early, with an empty snapshot.
class MetadataExtractor {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    MetadataExtractor(ProberFactory& factory, CacheManager& cache, Clock clock = {});

    // Non-copyable
    MetadataExtractor(const MetadataExtractor&) = delete;
    MetadataExtractor& operator=(const MetadataExtractor&) = delete;

    Snapshot extract(const ExtractOptions& options);

    // Drop the cached snapshot and extract from the database. With useCache
    // set the result is written back under the same rules as extract(): a
    // failed connection or listing leaves the cache empty, and a cache
    // write failure is logged, not thrown.
    Snapshot refresh(const ExtractOptions& options);

    Snapshot extractAllMetadata(bool includeSamples = true, int sampleRows = 3,
                                bool includeStatistics = true, bool useCache = true);

    void clearCache();

private:
    Snapshot probeAll(const ExtractOptions& options);

    TableMeta probeTable(SchemaProber& prober, const RelationInfo& info,
                         const ExtractOptions& options, Snapshot& snapshot);
    ViewMeta probeView(SchemaProber& prober, const RelationInfo& info,
                       const ExtractOptions& options, Snapshot& snapshot);
    std::map<std::string, ColumnStats> probeStatistics(SchemaProber& prober,
                                                       const std::string& table,
                                                       const std::vector<ColumnMeta>& columns,
                                                       Snapshot& snapshot);

    template <typename T, typename Fn>
    T probe(Snapshot& snapshot, const std::string& relation, const char* step, Fn&& fn, T fallback);

    static void recordWarning(Snapshot& snapshot, const std::string& relation,
                              const std::string& step, const std::string& message);

    std::chrono::system_clock::time_point now() const;

    ProberFactory& m_factory;
    CacheManager& m_cache;
    Clock m_clock;
};

}  // namespace querymind
