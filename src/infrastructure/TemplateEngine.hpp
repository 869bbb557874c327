/**
 * @file TemplateEngine.hpp
 * @brief Layout rendering through the inja template library.
 */

#pragma once
#include "domain/Renderers.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace quire::infrastructure {

/**
 * @class TemplateEngine
 * @brief Renders Jinja-style layouts ({{ page.content }}, {% for post in posts %}) with inja.
 *
 * Values are emitted as-is; layouts call escape(...) for HTML-escaped output.
 * A fresh inja::Environment is used per call so concurrent renders share nothing.
 */
class TemplateEngine : public domain::TemplateRenderer {
public:
    domain::Outcome<std::string> render(const std::string& templateText,
                                        const nlohmann::json& context) const override;

    /** @brief Escapes &, <, >, " and ' for HTML output. */
    static std::string EscapeHtml(const std::string& text);

    /** @brief Copy of @p context with invalid UTF-8 in strings replaced by U+FFFD. */
    static nlohmann::json SanitizeUtf8(const nlohmann::json& context);
};

} // namespace quire::infrastructure
