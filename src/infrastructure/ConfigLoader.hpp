/**
 * @file ConfigLoader.hpp
 * @brief Static utility for reading a project's config.json into a SiteConfig.
 *
 * Recognized keys: out_dir, generate_rss, title, description, url, author,
 * theme and max_workers. Every other key is kept verbatim for templates.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "domain/Outcome.hpp"
#include "domain/Site.hpp"

namespace quire::infrastructure {

class ConfigLoader {
public:
    static constexpr const char* FileName = "config.json";
    static constexpr const char* DefaultOutDir = "build";

    /**
     * @brief Reads <projectRoot>/config.json; a missing file yields the defaults.
     * @param projectRoot Project directory; a relative out_dir is resolved against it.
     * @return The configuration, or RenderError when the file is not valid.
     */
    static domain::Outcome<domain::SiteConfig> Load(const std::string& projectRoot);

    /** @brief Builds a configuration from an already parsed document. */
    static domain::Outcome<domain::SiteConfig> FromJson(const nlohmann::json& document, const std::string& projectRoot);
};

} // namespace quire::infrastructure
