/**
 * @file corpus_writer.cpp
 * @brief CorpusWriter implementation
 */

#include <storage/corpus_writer.hpp>
#include <storage/format_utils.hpp>
#include <config/config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <map>
#include <set>
#include <stdexcept>

namespace WikiCorpus {

namespace {

DedupCache::Id parse_id(const std::string& text) {
    return static_cast<DedupCache::Id>(std::stoll(text));
}

} // namespace

CorpusWriter::CorpusWriter(PostgresConnection& db, std::string schema, DedupCache cache, std::string ts_config)
    : db_(db), schema_(std::move(schema)), ts_config_(std::move(ts_config)), cache_(std::move(cache)) {
    if (!is_simple_identifier(schema_)) {
        throw std::invalid_argument("Invalid schema name: '" + schema_ + "'");
    }
    if (!is_simple_identifier(ts_config_)) {
        throw std::invalid_argument("Invalid text search configuration: '" + ts_config_ + "'");
    }

    const std::string s = schema_ + ".";

    sql_insert_article_ =
        "INSERT INTO " + s + "articles (title, content, size, last_modified, is_redirect) "
        "VALUES ($1, $2, $3, $4, $5) RETURNING id";
    sql_insert_search_ =
        "INSERT INTO " + s + "article_search (article_id, document) VALUES ($1, "
        "setweight(to_tsvector('" + ts_config_ + "', $2), 'A') || "
        "setweight(to_tsvector('" + ts_config_ + "', $3), 'B'))";
    sql_insert_redirect_ =
        "INSERT INTO " + s + "redirects (from_title, to_title) VALUES ($1, $2)";

    sql_select_category_ = "SELECT id FROM " + s + "categories WHERE name = $1";
    sql_insert_category_ =
        "INSERT INTO " + s + "categories (name) VALUES ($1) ON CONFLICT (name) DO NOTHING RETURNING id";
    sql_link_category_ =
        "INSERT INTO " + s + "article_categories (article_id, category_id) VALUES ($1, $2)";

    sql_select_image_ = "SELECT id FROM " + s + "images WHERE hash = $1";
    sql_insert_image_ =
        "INSERT INTO " + s + "images (filename, path, size, mime_type, hash, caption) "
        "VALUES ($1, $2, $3, $4, $5, NULLIF($6, '')) ON CONFLICT (hash) DO NOTHING RETURNING id";
    sql_link_image_ =
        "INSERT INTO " + s + "article_images (article_id, position, image_id) VALUES ($1, $2, $3)";
}

CorpusWriter::Id CorpusWriter::write(const Article& article) {
    Id id = 0;
    try {
        validate_article(article);
        PostgresConnection::Transaction txn(db_);
        resolve_relations(std::span<const Article>(&article, 1));
        id = insert_article(article);
        txn.commit();
    } catch (...) {
        cache_.discard();
        throw;
    }
    cache_.commit();
    return id;
}

size_t CorpusWriter::write_batch(std::span<const Article> articles) {
    if (articles.empty()) return 0;

    for (const auto& article : articles) {
        validate_article(article);
    }

    try {
        PostgresConnection::Transaction txn(db_);
        resolve_relations(articles);
        for (const auto& article : articles) {
            insert_article(article);
        }
        txn.commit();
    } catch (...) {
        cache_.discard();
        throw;
    }
    cache_.commit();
    return articles.size();
}

void CorpusWriter::resolve_relations(std::span<const Article> articles) {
    std::set<std::string> names;
    std::map<std::string, const ImageRef*> images;
    for (const auto& article : articles) {
        if (article.is_redirect) continue;
        names.insert(article.categories.begin(), article.categories.end());
        for (const auto& image : article.images) {
            images.emplace(image.hash, &image);
        }
    }

    try {
        for (const auto& name : names) {
            get_or_create_category(name);
        }
        for (const auto& [hash, image] : images) {
            get_or_create_image(*image);
        }
    } catch (const StoreError& e) {
        throw with_context(e, "resolving categories and images of " + std::to_string(articles.size()) +
                              " article(s) starting at '" + articles.front().title + "'");
    }
}

CorpusWriter::Id CorpusWriter::insert_article(const Article& article) {
    try {
        auto row = db_.query_single(sql_insert_article_, {
            article.title,
            article.content,
            std::to_string(article.size),
            format_iso8601(article.last_modified),
            bool_literal(article.is_redirect)
        });
        if (!row) {
            throw StoreError("INSERT ... RETURNING id produced no row");
        }
        Id article_id = parse_id(*row);

        db_.execute(sql_insert_search_, {std::to_string(article_id), article.title, article.content});

        if (article.is_redirect) {
            db_.execute(sql_insert_redirect_, {article.title, *article.redirect_target});
            Logger::debug("Redirect " + article.title + " -> " + *article.redirect_target);
            return article_id;
        }

        const std::string aid = std::to_string(article_id);

        for (const auto& name : article.categories) {
            Id category_id = get_or_create_category(name);
            db_.execute(sql_link_category_, {aid, std::to_string(category_id)});
        }

        for (size_t i = 0; i < article.images.size(); ++i) {
            Id image_id = get_or_create_image(article.images[i]);
            db_.execute(sql_link_image_, {aid, std::to_string(i), std::to_string(image_id)});
        }

        return article_id;
    } catch (const StoreError& e) {
        throw with_context(e, "article '" + article.title + "'");
    }
}

CorpusWriter::Id CorpusWriter::get_or_create_category(const std::string& name) {
    if (auto cached = cache_.find_category(name)) {
        return *cached;
    }

    // Store lookup, then insert. A concurrent writer may win the insert;
    // ON CONFLICT waits for it to commit and the re-select then sees its row.
    auto existing = db_.query_single(sql_select_category_, {name});
    if (!existing) {
        existing = db_.query_single(sql_insert_category_, {name});
        if (!existing) {
            Logger::debug("Category '" + name + "' created concurrently, re-reading");
            existing = db_.query_single(sql_select_category_, {name});
        }
    }
    if (!existing) {
        throw StoreError("Category '" + name + "' vanished after insert conflict");
    }

    Id id = parse_id(*existing);
    cache_.add_category(name, id);
    return id;
}

CorpusWriter::Id CorpusWriter::get_or_create_image(const ImageRef& image) {
    if (auto cached = cache_.find_image(image.hash)) {
        return *cached;
    }

    auto existing = db_.query_single(sql_select_image_, {image.hash});
    if (!existing) {
        existing = db_.query_single(sql_insert_image_, {
            image.filename,
            image.path,
            std::to_string(image.size),
            image.mime_type,
            image.hash,
            image.caption.value_or("")
        });
        if (!existing) {
            Logger::debug("Image " + image.hash + " created concurrently, re-reading");
            existing = db_.query_single(sql_select_image_, {image.hash});
        }
    }
    if (!existing) {
        throw StoreError("Image " + image.hash + " vanished after insert conflict");
    }

    Id id = parse_id(*existing);
    cache_.add_image(image.hash, id);
    return id;
}

} // namespace WikiCorpus
