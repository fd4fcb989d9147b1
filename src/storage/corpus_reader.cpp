/**
 * @file corpus_reader.cpp
 * @brief CorpusReader implementation
 */

#include <storage/corpus_reader.hpp>
#include <config/config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <set>
#include <stdexcept>

namespace WikiCorpus {

CorpusReader::CorpusReader(PostgresConnection& db, std::string schema, std::string ts_config)
    : db_(db), schema_(std::move(schema)), ts_config_(std::move(ts_config)) {
    if (!is_simple_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: '" + schema_ + "'");
    }
    if (!is_simple_identifier(ts_config_)) {
        throw std::invalid_argument("Invalid text search configuration: '" + ts_config_ + "'");
    }
}

std::optional<Article> CorpusReader::get_article(const std::string& title) {
    std::set<std::string> visited;
    std::string current = title;

    for (int hop = 0; hop <= MAX_REDIRECT_HOPS; ++hop) {
        if (!visited.insert(current).second) {
            Logger::warn("Redirect cycle at '" + current + "' while resolving '" + title + "'");
            return std::nullopt;
        }

        auto article = get_article_raw(current);
        if (!article) {
            if (hop > 0) {
                Logger::warn("Redirect from '" + title + "' dangles at '" + current + "'");
            }
            return std::nullopt;
        }
        if (!article->is_redirect) {
            return article;
        }
        current = *article->redirect_target;
    }

    Logger::warn("Redirect chain from '" + title + "' exceeds " + std::to_string(MAX_REDIRECT_HOPS) + " hops");
    return std::nullopt;
}

std::optional<Article> CorpusReader::get_article_raw(const std::string& title) {
    std::optional<Article> result;
    int64_t article_id = 0;

    db_.query(
        "SELECT a.id, a.title, a.content, a.size, "
        "       extract(epoch FROM a.last_modified)::bigint, a.is_redirect, r.to_title "
        "FROM " + schema_ + ".articles a "
        "LEFT JOIN " + schema_ + ".redirects r ON r.from_title = a.title "
        "WHERE a.title = $1",
        {title},
        [&](const PostgresConnection::Row& row) {
            Article a;
            article_id = std::stoll(row[0]);
            a.title = row[1];
            a.content = row[2];
            a.size = std::stoull(row[3]);
            a.last_modified = TimePoint(std::chrono::seconds(std::stoll(row[4])));
            a.is_redirect = row[5] == "t";
            if (a.is_redirect) {
                a.redirect_target = row[6];
            }
            result = std::move(a);
        });

    if (result && !result->is_redirect) {
        load_relations(article_id, *result);
    }
    return result;
}

void CorpusReader::load_relations(int64_t article_id, Article& article) {
    const std::string aid = std::to_string(article_id);

    db_.query(
        "SELECT c.name FROM " + schema_ + ".article_categories ac "
        "JOIN " + schema_ + ".categories c ON c.id = ac.category_id "
        "WHERE ac.article_id = $1",
        {aid},
        [&](const PostgresConnection::Row& row) {
            article.categories.insert(row[0]);
        });

    db_.query(
        "SELECT i.filename, i.path, i.size, i.mime_type, i.hash, i.caption IS NOT NULL, coalesce(i.caption, '') "
        "FROM " + schema_ + ".article_images ai "
        "JOIN " + schema_ + ".images i ON i.id = ai.image_id "
        "WHERE ai.article_id = $1 ORDER BY ai.position",
        {aid},
        [&](const PostgresConnection::Row& row) {
            ImageRef image;
            image.filename = row[0];
            image.path = row[1];
            image.size = std::stoull(row[2]);
            image.mime_type = row[3];
            image.hash = row[4];
            if (row[5] == "t") image.caption = row[6];
            article.images.push_back(std::move(image));
        });
}

std::optional<std::string> CorpusReader::get_redirect(const std::string& title) {
    return db_.query_single(
        "SELECT to_title FROM " + schema_ + ".redirects WHERE from_title = $1", {title});
}

std::vector<SearchHit> CorpusReader::search_articles(const std::string& query, size_t limit) {
    std::vector<SearchHit> hits;
    if (limit == 0) return hits;

    db_.query(
        "SELECT a.title, a.size, ts_rank(s.document, q) AS rank "
        "FROM " + schema_ + ".article_search s "
        "JOIN " + schema_ + ".articles a ON a.id = s.article_id, "
        "plainto_tsquery('" + ts_config_ + "', $1) q "
        "WHERE s.document @@ q AND NOT a.is_redirect "
        "ORDER BY rank DESC, a.title LIMIT $2",
        {query, std::to_string(limit)},
        [&](const PostgresConnection::Row& row) {
            hits.push_back({row[0], static_cast<size_t>(std::stoull(row[1])), std::stod(row[2])});
        });

    return hits;
}

std::vector<std::string> CorpusReader::list_categories() {
    std::vector<std::string> names;
    db_.query("SELECT name FROM " + schema_ + ".categories ORDER BY name",
              [&](const PostgresConnection::Row& row) { names.push_back(row[0]); });
    return names;
}

std::vector<std::string> CorpusReader::articles_in_category(const std::string& name) {
    std::vector<std::string> titles;
    db_.query(
        "SELECT a.title FROM " + schema_ + ".articles a "
        "JOIN " + schema_ + ".article_categories ac ON ac.article_id = a.id "
        "JOIN " + schema_ + ".categories c ON c.id = ac.category_id "
        "WHERE c.name = $1 ORDER BY a.title",
        {name},
        [&](const PostgresConnection::Row& row) { titles.push_back(row[0]); });
    return titles;
}

size_t CorpusReader::count_articles() {
    auto n = db_.query_single("SELECT count(*) FROM " + schema_ + ".articles");
    return n ? static_cast<size_t>(std::stoull(*n)) : 0;
}

} // namespace WikiCorpus
