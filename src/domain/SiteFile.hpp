/**
 * @file SiteFile.hpp
 * @brief File record used for both build inputs (layouts, assets, sources) and outputs.
 */

#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace quire::domain {

/**
 * @struct SiteFile
 * @brief A path, its base name, its stripped identifier and (for outputs) its content.
 */
struct SiteFile {
    std::string path;     ///< Full path.
    std::string basename; ///< File name with extensions.
    std::string stripped; ///< First dot-delimited segment of the base name.
    std::string content;  ///< Rendered text for outputs, empty for inputs.

    /** @brief Returns the first dot-delimited segment of a file name ("post.html.mustache" -> "post"). */
    static std::string StripName(const std::string& basename) {
        return basename.substr(0, basename.find('.'));
    }

    /** @brief Input record for an existing file. */
    static SiteFile fromPath(const std::string& path) {
        SiteFile file;
        file.path = path;
        file.basename = std::filesystem::path(path).filename().string();
        file.stripped = StripName(file.basename);
        return file;
    }

    /** @brief Output record that will be written to @p path. */
    static SiteFile construct(const std::string& path, const std::string& content) {
        SiteFile file = fromPath(path);
        file.content = content;
        return file;
    }

    nlohmann::json toContext() const {
        return {
            {"path", path},
            {"basename", basename},
            {"stripped", stripped}
        };
    }
};

} // namespace quire::domain
