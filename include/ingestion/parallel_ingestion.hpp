/**
 * @file parallel_ingestion.hpp
 * @brief Fixed worker pool that writes a batch of articles in parallel
 */

#pragma once

#include <database/postgres_connection.hpp>
#include <parser/article.hpp>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace WikiCorpus {

using ConnectionFactory = std::function<std::unique_ptr<PostgresConnection>()>;

struct IngestionOptions {
    size_t workers = 1;
    size_t sub_batch_size = 100;
    std::string schema = "wikicorpus";
    std::string ts_config = "english";
};

/**
 * @brief Partitions a batch into contiguous chunks, one per worker thread.
 *
 * Chunk size is ceil(N / workers). Each worker opens its own connection and
 * CorpusWriter (and so its own DedupCache) and commits one transaction per
 * sub-batch. Sub-batches committed before a failure stay committed.
 *
 * import_all() is fail-fast: the first worker error is rethrown as soon as it
 * happens, without waiting for or cancelling the other workers. Those are
 * joined by the next import_all() call or by the destructor.
 */
class ParallelIngestionCoordinator {
public:
    ParallelIngestionCoordinator(ConnectionFactory factory, IngestionOptions options);
    ~ParallelIngestionCoordinator();

    ParallelIngestionCoordinator(const ParallelIngestionCoordinator&) = delete;
    ParallelIngestionCoordinator& operator=(const ParallelIngestionCoordinator&) = delete;

    /**
     * @brief Write every article, blocking until all workers finish.
     * @return Number of articles imported (articles.size())
     * @throws The first worker's error, annotated with worker and sub-batch
     */
    size_t import_all(std::vector<Article> articles);

    /**
     * @brief Articles committed by this coordinator across all calls, including
     *        sub-batches committed by a call that later failed.
     */
    size_t committed() const { return committed_.load(); }

    const IngestionOptions& options() const { return options_; }

    /**
     * @brief Block until workers left over from a failed call have exited.
     */
    void join_stragglers();

private:
    struct Run {
        std::vector<std::vector<Article>> chunks;
        std::mutex mutex;
        std::condition_variable done_cv;
        size_t remaining = 0;
        std::exception_ptr error;
    };

    void run_worker(const std::shared_ptr<Run>& run, size_t index);
    void report_failure(Run& run, std::exception_ptr error);

    ConnectionFactory factory_;
    IngestionOptions options_;
    std::atomic<size_t> committed_{0};
    std::vector<std::thread> threads_;
};

} // namespace WikiCorpus
