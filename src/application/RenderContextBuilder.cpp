/**
 * @file RenderContextBuilder.cpp
 * @brief Implementation of RenderContextBuilder.
 */

#include "application/RenderContextBuilder.hpp"
#include <algorithm>

namespace quire::application {

nlohmann::json RenderContextBuilder::build(const domain::Site& site, const domain::Page& page) {
    return {
        {"page", page.toContext()},
        {"pages", normalized(site.getPages())},
        {"posts", normalized(site.getPosts())},
        {"config", site.getConfig().toContext()},
        {"theme", site.getTheme().toContext()}
    };
}

nlohmann::json RenderContextBuilder::normalized(const std::vector<domain::Page>& pages) {
    std::vector<const domain::Frontmatter*> ordered;
    ordered.reserve(pages.size());
    for (const auto& page : pages) {
        ordered.push_back(&page.getFrontmatter());
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const domain::Frontmatter* left, const domain::Frontmatter* right) {
            return left->date > right->date;
        });

    nlohmann::json result = nlohmann::json::array();
    for (const auto* frontmatter : ordered) {
        result.push_back(frontmatter->toContext());
    }
    return result;
}

} // namespace quire::application
