#pragma once

#include "types.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace firmlink {

struct ExecutorOptions {
    unsigned worker_count = 0;              // 0 = available cores - 1, 1 = sequential
    unsigned max_workers = 4;
    std::size_t min_parallel_sources = 100; // smaller inputs never fan out
    bool verbose = false;

    void validate() const;
};

struct ExecutorStats {
    unsigned workers = 0;
    std::size_t chunks = 0;
    std::size_t chunks_retried = 0;
};

// Contiguous slice [begin, end) of the source list.
struct SourceChunk {
    std::size_t index = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
};

// Best fuzzy target for one source, indices into the caller's lists.
struct FuzzyHit {
    std::size_t source = 0;
    std::size_t target = 0;
    double score = 0.0;
};

// Scores one chunk. Must only read shared state.
using ChunkTask = std::function<std::vector<FuzzyHit>(const SourceChunk&)>;

class ScoringExecutor {
public:
    explicit ScoringExecutor(ExecutorOptions options = {});

    // Number of workers a run over source_count sources would use
    unsigned workers_for(std::size_t source_count) const;

    // Runs task over contiguous chunks of sources and concatenates the
    // results in chunk order. A chunk that fails is re-run once on the
    // calling thread; a second failure throws WorkerExecutionError.
    std::vector<FuzzyHit> run(const std::vector<RawName>& sources, const ChunkTask& task);

    const ExecutorStats& stats() const { return stats_; }
    const ExecutorOptions& options() const { return options_; }

private:
    ExecutorOptions options_;
    ExecutorStats stats_;
};

// Splits count items into at most parts contiguous, disjoint, non-empty chunks.
std::vector<SourceChunk> split_chunks(std::size_t count, unsigned parts);

} // namespace firmlink
