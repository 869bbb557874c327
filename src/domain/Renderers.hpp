/**
 * @file Renderers.hpp
 * @brief Interfaces for the text-producing collaborators of a build.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Outcome.hpp"
#include "Site.hpp"

namespace quire::domain {

/**
 * @class TemplateRenderer
 * @brief Substitutes context data into a layout template.
 *
 * Template errors (bad syntax, unknown variables) are reported as RenderError
 * instead of being thrown.
 */
class TemplateRenderer {
public:
    virtual ~TemplateRenderer() = default;

    /**
     * @param templateText Raw layout content.
     * @param context Data exposed to the template.
     * @return Rendered text or RenderError.
     */
    virtual Outcome<std::string> render(const std::string& templateText, const nlohmann::json& context) const = 0;
};

/**
 * @class FeedRenderer
 * @brief Produces a syndication document from a site's posts.
 */
class FeedRenderer {
public:
    virtual ~FeedRenderer() = default;
    virtual std::string render(const Site& site) const = 0;
};

} // namespace quire::domain
