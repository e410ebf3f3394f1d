#include "firmlink/executor.h"
#include "firmlink/errors.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <system_error>
#include <thread>

namespace firmlink {

namespace {

void run_chunk(const ChunkTask& task, const SourceChunk& chunk, std::vector<FuzzyHit>& slot,
               std::exception_ptr& failure) {
    try {
        slot = task(chunk);
    } catch (...) {
        // Handed back to the calling thread, which retries the chunk
        failure = std::current_exception();
    }
}

std::string describe_failure(const std::exception_ptr& failure) {
    try {
        std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

} // namespace

void ExecutorOptions::validate() const {
    if (max_workers == 0) {
        throw ConfigError("max_workers must be at least 1");
    }
}

ScoringExecutor::ScoringExecutor(ExecutorOptions options) : options_(options) {
    options_.validate();
}

unsigned ScoringExecutor::workers_for(std::size_t source_count) const {
    if (source_count < options_.min_parallel_sources) {
        return 1;
    }
    unsigned workers = options_.worker_count;
    if (workers == 0) {
        unsigned cores = std::thread::hardware_concurrency();
        workers = cores > 1 ? cores - 1 : 1;
    }
    workers = std::min(workers, options_.max_workers);
    if (source_count < workers) {
        workers = static_cast<unsigned>(std::max<std::size_t>(source_count, 1));
    }
    return workers;
}

std::vector<SourceChunk> split_chunks(std::size_t count, unsigned parts) {
    std::vector<SourceChunk> chunks;
    if (count == 0 || parts == 0) {
        return chunks;
    }
    // Contiguous ranges, the first count % n one source longer, so merging
    // slots in chunk order restores source order
    std::size_t n = std::min<std::size_t>(parts, count);
    std::size_t base = count / n;
    std::size_t extra = count % n;
    std::size_t begin = 0;
    for (std::size_t i = 0; i < n; ++i) {
        std::size_t size = base + (i < extra ? 1 : 0);
        chunks.push_back(SourceChunk{i, begin, begin + size});
        begin += size;
    }
    return chunks;
}

std::vector<FuzzyHit> ScoringExecutor::run(const std::vector<RawName>& sources, const ChunkTask& task) {
    stats_ = ExecutorStats{};
    if (sources.empty()) {
        return {};
    }

    unsigned workers = workers_for(sources.size());
    std::vector<SourceChunk> chunks = split_chunks(sources.size(), workers);
    std::vector<std::vector<FuzzyHit>> slots(chunks.size());
    std::vector<std::exception_ptr> failures(chunks.size());
    stats_.workers = workers;
    stats_.chunks = chunks.size();

    if (options_.verbose) {
        std::cerr << "[firmlink] fuzzy scoring " << sources.size() << " sources with "
                  << workers << " worker(s)" << std::endl;
    }

    if (workers == 1) {
        run_chunk(task, chunks[0], slots[0], failures[0]);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(chunks.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            try {
                threads.emplace_back(run_chunk, std::cref(task), std::cref(chunks[i]),
                                     std::ref(slots[i]), std::ref(failures[i]));
            } catch (const std::system_error& e) {
                failures[i] = std::make_exception_ptr(e);
            }
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    // Failed chunks get one more try on this thread before the run fails
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (!failures[i]) {
            continue;
        }
        const SourceChunk& chunk = chunks[i];
        ++stats_.chunks_retried;
        std::cerr << "[firmlink] warning: scoring chunk " << i << " failed ("
                  << describe_failure(failures[i]) << "), retrying sequentially" << std::endl;
        slots[i].clear();
        try {
            slots[i] = task(chunk);
        } catch (const std::exception& e) {
            throw WorkerExecutionError(i, sources[chunk.begin], sources[chunk.end - 1], e.what());
        } catch (...) {
            throw WorkerExecutionError(i, sources[chunk.begin], sources[chunk.end - 1], "unknown error");
        }
    }

    std::vector<FuzzyHit> merged;
    for (auto& slot : slots) {
        merged.insert(merged.end(), slot.begin(), slot.end());
    }
    return merged;
}

} // namespace firmlink
