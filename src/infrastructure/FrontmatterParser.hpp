/**
 * @file FrontmatterParser.hpp
 * @brief Splits a content file into its front matter and body.
 */

#pragma once
#include <string>
#include "domain/Page.hpp"

namespace quire::infrastructure {

/**
 * @struct ParsedSource
 * @brief Result of splitting one content file.
 */
struct ParsedSource {
    domain::Frontmatter frontmatter;
    std::string body;
};

/**
 * @class FrontmatterParser
 * @brief Reads a leading block delimited by "---" lines made of "key: value" entries.
 *
 * "true"/"false" become booleans, surrounding quotes are removed and lines
 * starting with '#' are ignored. layout, title and date are lifted into the
 * Frontmatter; other keys go to its metadata. Without a closed block the whole
 * text is the body.
 */
class FrontmatterParser {
public:
    /**
     * @param text Full file content.
     * @param defaultLayout Layout used when the block does not name one.
     */
    static ParsedSource Parse(const std::string& text, const std::string& defaultLayout);
};

} // namespace quire::infrastructure
