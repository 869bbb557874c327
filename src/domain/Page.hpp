/**
 * @file Page.hpp
 * @brief Domain entities for site content: front matter and pages (posts are dated pages).
 */

#pragma once
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "SiteFile.hpp"

namespace quire::domain {

/**
 * @struct Frontmatter
 * @brief Structured metadata attached to a content file.
 */
struct Frontmatter {
    std::string layout; ///< Layout name, matched against theme layout files.
    std::string title;
    std::string date;   ///< ISO date (YYYY-MM-DD), compared lexicographically.
    nlohmann::json metadata = nlohmann::json::object(); ///< Any other keys.

    /** @brief Flattens the front matter into one object; named fields win over metadata. */
    nlohmann::json toContext() const {
        nlohmann::json context = metadata.is_object() ? metadata : nlohmann::json::object();
        context["layout"] = layout;
        context["title"] = title;
        context["date"] = date;
        return context;
    }
};

/**
 * @class Page
 * @brief A source file with its front matter and body. Immutable after construction.
 */
class Page {
public:
    Page(SiteFile file, Frontmatter frontmatter, std::string content)
        : m_file(std::move(file)), m_frontmatter(std::move(frontmatter)), m_content(std::move(content)) {}

    const SiteFile& getFile() const { return m_file; }
    const Frontmatter& getFrontmatter() const { return m_frontmatter; }
    const std::string& getContent() const { return m_content; }

    /** @brief Output name relative to the output directory. */
    std::string getOutputName() const { return m_file.stripped + ".html"; }

    nlohmann::json toContext() const {
        return {
            {"file", m_file.toContext()},
            {"filename", m_file.basename},
            {"stripped", m_file.stripped},
            {"url", getOutputName()},
            {"content", m_content},
            {"frontmatter", m_frontmatter.toContext()}
        };
    }

private:
    SiteFile m_file;
    Frontmatter m_frontmatter;
    std::string m_content;
};

} // namespace quire::domain
