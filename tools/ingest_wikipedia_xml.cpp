// ingest_wikipedia_xml.cpp
// Streams an encyclopedia XML dump into the corpus schema.
//   - The parser runs on the main thread and fills batches of `batch` articles
//   - Each full batch goes to the ParallelIngestionCoordinator on a background
//     task while the parser keeps reading; at most one batch is in flight
//   - Invalid records are logged and skipped

#include <config/config.hpp>
#include <database/postgres_connection.hpp>
#include <ingestion/parallel_ingestion.hpp>
#include <parser/dump_stream_parser.hpp>
#include <storage/corpus_reader.hpp>
#include <storage/corpus_schema.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace WikiCorpus;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <dump.xml> [config.json]" << std::endl;
        return 1;
    }

    try {
        CorpusConfig config = argc >= 3 ? CorpusConfig::load_file(argv[2]) : CorpusConfig::load_from_env();
        config.apply_logging();

        Timer total_timer;

        {
            PostgresConnection db(config.conninfo);
            CorpusSchema schema(db, config.schema);
            schema.initialize();
            Logger::info("Schema " + schema.name() + " ready");
        }

        IngestionOptions options;
        options.workers = config.workers;
        options.sub_batch_size = config.sub_batch_size;
        options.schema = config.schema;
        options.ts_config = config.ts_config;

        ParallelIngestionCoordinator coordinator(
            [conninfo = config.conninfo] { return std::make_unique<PostgresConnection>(conninfo); },
            options);

        std::vector<Article> batch;
        batch.reserve(config.pipeline_batch_size);
        std::future<size_t> in_flight;
        size_t imported = 0;
        size_t skipped = 0;

        auto hand_off = [&] {
            if (in_flight.valid()) imported += in_flight.get();
            in_flight = std::async(std::launch::async, [&coordinator, b = std::move(batch)]() mutable {
                return coordinator.import_all(std::move(b));
            });
            batch = std::vector<Article>();
            batch.reserve(config.pipeline_batch_size);
        };

        DumpStreamParser parser(
            [&](Article&& article) {
                batch.push_back(std::move(article));
                if (batch.size() >= config.pipeline_batch_size) hand_off();
            },
            [&](const ValidationError& e) {
                ++skipped;
                Logger::warn("Skipping invalid record: " + std::string(e.what()));
            });

        Logger::step("Parsing " + std::string(argv[1]));
        size_t parsed = 0;
        try {
            parsed = parser.parse_file(argv[1]);
        } catch (...) {
            // Let the batch in flight settle before reporting the parse failure
            if (in_flight.valid()) in_flight.wait();
            throw;
        }

        if (!batch.empty()) hand_off();
        if (in_flight.valid()) imported += in_flight.get();

        const auto& meta = parser.metadata();
        if (!meta.site_name.empty()) {
            Logger::info("Source: " + meta.site_name + " (" + meta.db_name + ", " + meta.generator + ")");
        }

        PostgresConnection db(config.conninfo);
        CorpusReader reader(db, config.schema, config.ts_config);

        std::cout << "\n[COMPLETE] Parsed " << parsed << " articles, imported " << imported
                  << ", skipped " << skipped << " invalid in " << total_timer.elapsed_sec() << "s ("
                  << reader.count_articles() << " articles in " << config.schema << ")" << std::endl;
        return 0;

    } catch (const CorpusError& e) {
        Logger::error(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error(std::string("Fatal: ") + e.what());
        return 1;
    }
}
