// search.cpp
// Full-text search over an ingested corpus.

#include <config/config.hpp>
#include <database/postgres_connection.hpp>
#include <storage/corpus_reader.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

#include <iomanip>
#include <iostream>
#include <string>

using namespace WikiCorpus;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <query> [limit]" << std::endl;
        return 1;
    }

    try {
        CorpusConfig config = CorpusConfig::load_from_env();
        config.apply_logging();

        size_t limit = 10;
        if (argc >= 3) {
            limit = std::stoul(argv[2]);
        }

        PostgresConnection db(config.conninfo);
        CorpusReader reader(db, config.schema, config.ts_config);

        auto hits = reader.search_articles(argv[1], limit);
        if (hits.empty()) {
            std::cout << "No matches for \"" << argv[1] << "\"" << std::endl;
            return 0;
        }

        for (const auto& hit : hits) {
            std::cout << std::setw(8) << std::fixed << std::setprecision(4) << hit.rank << "  "
                      << hit.title << "  (" << hit.size << " bytes)" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
