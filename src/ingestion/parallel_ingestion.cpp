/**
 * @file parallel_ingestion.cpp
 * @brief ParallelIngestionCoordinator implementation
 */

#include <ingestion/parallel_ingestion.hpp>
#include <storage/corpus_writer.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <iterator>
#include <span>
#include <stdexcept>

namespace WikiCorpus {

ParallelIngestionCoordinator::ParallelIngestionCoordinator(ConnectionFactory factory, IngestionOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {
    if (!factory_) {
        throw std::invalid_argument("ParallelIngestionCoordinator requires a connection factory");
    }
    if (options_.workers == 0) {
        throw std::invalid_argument("worker count must be positive");
    }
    if (options_.sub_batch_size == 0) {
        throw std::invalid_argument("sub-batch size must be positive");
    }
}

ParallelIngestionCoordinator::~ParallelIngestionCoordinator() {
    join_stragglers();
}

void ParallelIngestionCoordinator::join_stragglers() {
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
}

size_t ParallelIngestionCoordinator::import_all(std::vector<Article> articles) {
    join_stragglers();

    const size_t total = articles.size();
    if (total == 0) return 0;

    const size_t chunk_size = (total + options_.workers - 1) / options_.workers;

    auto run = std::make_shared<Run>();
    for (size_t begin = 0; begin < total; begin += chunk_size) {
        size_t end = std::min(begin + chunk_size, total);
        run->chunks.emplace_back(std::make_move_iterator(articles.begin() + begin),
                                 std::make_move_iterator(articles.begin() + end));
    }
    articles.clear();
    run->remaining = run->chunks.size();

    Logger::step("Importing " + std::to_string(total) + " articles with " +
                 std::to_string(run->chunks.size()) + " workers (chunk " +
                 std::to_string(chunk_size) + ", sub-batch " + std::to_string(options_.sub_batch_size) + ")");

    Timer timer;
    const size_t before = committed_.load();

    threads_.reserve(run->chunks.size());
    for (size_t i = 0; i < run->chunks.size(); ++i) {
        threads_.emplace_back(&ParallelIngestionCoordinator::run_worker, this, run, i);
    }

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(run->mutex);
        run->done_cv.wait(lock, [&] { return run->remaining == 0 || run->error; });
        error = run->error;
    }

    if (error) {
        Logger::error("Import failed after " + std::to_string(committed_.load() - before) +
                      " committed articles");
        std::rethrow_exception(error);
    }

    join_stragglers();

    Logger::success("Imported " + std::to_string(total) + " articles in " +
                    std::to_string(static_cast<long long>(timer.elapsed_ms())) + " ms");
    return total;
}

void ParallelIngestionCoordinator::run_worker(const std::shared_ptr<Run>& run, size_t index) {
    const auto& chunk = run->chunks[index];
    const size_t sub_batch = options_.sub_batch_size;
    size_t offset = 0;

    try {
        std::unique_ptr<PostgresConnection> db = factory_();
        if (!db) {
            throw StoreError("Connection factory returned no connection");
        }
        CorpusWriter writer(*db, options_.schema, DedupCache(), options_.ts_config);

        std::span<const Article> all(chunk);
        for (offset = 0; offset < all.size(); offset += sub_batch) {
            auto part = all.subspan(offset, std::min(sub_batch, all.size() - offset));
            writer.write_batch(part);

            size_t done = committed_.fetch_add(part.size()) + part.size();
            Logger::debug("Worker " + std::to_string(index) + " committed " + std::to_string(part.size()) +
                          " articles at offset " + std::to_string(offset) + " (" + std::to_string(done) +
                          " total)");
        }
    } catch (const StoreError& e) {
        report_failure(*run, std::make_exception_ptr(with_context(
            e, "worker " + std::to_string(index) + ", sub-batch at offset " + std::to_string(offset))));
        return;
    } catch (const ValidationError& e) {
        report_failure(*run, std::make_exception_ptr(with_context(
            e, "worker " + std::to_string(index) + ", sub-batch at offset " + std::to_string(offset))));
        return;
    } catch (...) {
        report_failure(*run, std::current_exception());
        return;
    }

    Logger::info("Worker " + std::to_string(index) + " finished " + std::to_string(chunk.size()) +
                 " articles (" + std::to_string(committed_.load()) + " committed so far)");

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        --run->remaining;
    }
    run->done_cv.notify_all();
}

void ParallelIngestionCoordinator::report_failure(Run& run, std::exception_ptr error) {
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        if (!run.error) run.error = error;
        --run.remaining;
    }
    run.done_cv.notify_all();
}

} // namespace WikiCorpus
