/**
 * @file RenderContextBuilder.hpp
 * @brief Assembles the data a layout template sees when rendering one page.
 */

#pragma once
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/Site.hpp"

namespace quire::application {

/**
 * @class RenderContextBuilder
 * @brief Builds the page/pages/posts/config/theme context for a template.
 */
class RenderContextBuilder {
public:
    /**
     * @brief Builds the context for @p page.
     * @return Object with exactly the keys "page", "pages", "posts", "config" and "theme".
     */
    static nlohmann::json build(const domain::Site& site, const domain::Page& page);

    /**
     * @brief Front matter of each page, newest date first.
     *
     * Stable: pages sharing a date keep their input order.
     */
    static nlohmann::json normalized(const std::vector<domain::Page>& pages);
};

} // namespace quire::application
