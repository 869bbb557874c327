/**
 * @file Site.hpp
 * @brief Aggregate root of a build: configuration, theme files, pages and posts.
 */

#pragma once
#include <cstddef>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "Page.hpp"
#include "SiteFile.hpp"

namespace quire::domain {

/**
 * @struct SiteConfig
 * @brief Site-wide settings. Keys the builder does not interpret are kept in @ref extra.
 */
struct SiteConfig {
    std::string outDir;          ///< Output directory (absolute or relative to the working directory).
    bool generateRss = false;
    std::string title;
    std::string description;
    std::string url;             ///< Base url used for feed links.
    std::string author;
    std::string theme;
    std::size_t maxWorkers = 0;  ///< Upper bound on threads per phase; 0 means one per item.
    nlohmann::json extra = nlohmann::json::object();

    nlohmann::json toContext() const {
        nlohmann::json context = extra.is_object() ? extra : nlohmann::json::object();
        context["out_dir"] = outDir;
        context["generate_rss"] = generateRss;
        context["title"] = title;
        context["description"] = description;
        context["url"] = url;
        context["author"] = author;
        context["theme"] = theme;
        context["max_workers"] = maxWorkers;
        return context;
    }
};

/**
 * @struct Theme
 * @brief Layout templates and static assets bundled for a site.
 */
struct Theme {
    std::vector<SiteFile> layouts;
    std::vector<SiteFile> assets;

    nlohmann::json toContext() const {
        nlohmann::json layoutList = nlohmann::json::array();
        for (const auto& layout : layouts) {
            layoutList.push_back(layout.toContext());
        }
        nlohmann::json assetList = nlohmann::json::array();
        for (const auto& asset : assets) {
            assetList.push_back(asset.toContext());
        }
        return {{"layouts", layoutList}, {"assets", assetList}};
    }
};

/**
 * @class Site
 * @brief Immutable model of one site, constructed once per build.
 */
class Site {
public:
    Site(SiteConfig config, Theme theme, std::vector<Page> pages, std::vector<Page> posts)
        : m_config(std::move(config)),
          m_theme(std::move(theme)),
          m_pages(std::move(pages)),
          m_posts(std::move(posts)) {}

    const SiteConfig& getConfig() const { return m_config; }
    const Theme& getTheme() const { return m_theme; }
    const std::vector<Page>& getPages() const { return m_pages; }
    const std::vector<Page>& getPosts() const { return m_posts; }

    /** @brief Pages followed by posts, in declaration order. */
    std::vector<Page> getAllPages() const {
        std::vector<Page> all = m_pages;
        all.insert(all.end(), m_posts.begin(), m_posts.end());
        return all;
    }

private:
    SiteConfig m_config;
    Theme m_theme;
    std::vector<Page> m_pages;
    std::vector<Page> m_posts;
};

} // namespace quire::domain
