#include <parser/article.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <utils/errors.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace WikiCorpus {

std::string canonical_file_name(const std::string& filename) {
    std::string name = trim(filename);
    std::replace(name.begin(), name.end(), ' ', '_');
    if (!name.empty() && static_cast<unsigned char>(name[0]) < 0x80) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return name;
}

std::string mime_type_for(const std::string& filename) {
    static const std::unordered_map<std::string, std::string> types = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"}, {"svg", "image/svg+xml"}, {"webp", "image/webp"},
        {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"bmp", "image/bmp"}
    };

    size_t dot = filename.rfind('.');
    if (dot == std::string::npos || dot + 1 >= filename.size()) return "image/unknown";

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = types.find(ext);
    return it != types.end() ? it->second : "image/unknown";
}

ImageRef ImageRef::from_markup(const std::string& filename, std::optional<std::string> caption) {
    ImageRef img;
    img.filename = trim(filename);
    img.path = "/images/" + img.filename;
    img.mime_type = mime_type_for(img.filename);
    img.hash = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("File:" + canonical_file_name(img.filename)));
    img.caption = std::move(caption);
    return img;
}

ImageRef ImageRef::from_bytes(const std::string& filename, const std::string& bytes,
                              std::optional<std::string> caption) {
    ImageRef img;
    img.filename = trim(filename);
    img.path = "/images/" + img.filename;
    img.size = bytes.size();
    img.mime_type = mime_type_for(img.filename);
    img.hash = BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash(bytes));
    img.caption = std::move(caption);
    return img;
}

void validate_article(const Article& article) {
    if (article.title.empty()) {
        throw ValidationError("Article title is empty");
    }
    if (article.title.size() > k_max_title_bytes) {
        throw ValidationError("Article title exceeds " + std::to_string(k_max_title_bytes) + " bytes",
                              article.title);
    }
    if (article.is_redirect != article.redirect_target.has_value()) {
        throw ValidationError("Redirect flag and target disagree for '" + article.title + "'", article.title);
    }
    if (article.is_redirect && article.redirect_target->empty()) {
        throw ValidationError("Redirect '" + article.title + "' has an empty target", article.title);
    }
    if (article.is_redirect && (!article.categories.empty() || !article.images.empty())) {
        throw ValidationError("Redirect '" + article.title + "' carries categories or images", article.title);
    }
}

} // namespace WikiCorpus
