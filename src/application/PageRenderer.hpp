/**
 * @file PageRenderer.hpp
 * @brief Renders one page through its theme layout into an output file record.
 */

#pragma once
#include <string>
#include <vector>
#include "application/BuildLog.hpp"
#include "domain/ConsoleFormatter.hpp"
#include "domain/FileSystem.hpp"
#include "domain/Outcome.hpp"
#include "domain/Renderers.hpp"
#include "domain/Site.hpp"
#include "domain/SiteFile.hpp"

namespace quire::application {

/**
 * @class PageRenderer
 * @brief Resolves a page's layout, reads it and renders it with the page context.
 *
 * The only side effect is reading the layout file; the output is not written here.
 */
class PageRenderer {
public:
    PageRenderer(const domain::FileSystem& fileSystem,
                 const domain::TemplateRenderer& templates,
                 const domain::ConsoleFormatter& formatter,
                 BuildLog& log);

    /**
     * @brief Renders @p page.
     * @return A file at {out_dir}/{stripped}.html carrying the rendered text,
     *         LayoutNotFound when the theme lacks the layout, IOError when it cannot be read,
     *         or RenderError when the template engine rejects it.
     */
    domain::Outcome<domain::SiteFile> render(const domain::Site& site, const domain::Page& page) const;

    /**
     * @brief Finds the first layout whose base name, up to the first dot, equals @p name.
     * @return Path of the layout file or LayoutNotFound.
     */
    static domain::Outcome<std::string> findLayout(const std::vector<domain::SiteFile>& layouts,
                                                   const std::string& name);

private:
    const domain::FileSystem& m_fileSystem;
    const domain::TemplateRenderer& m_templates;
    const domain::ConsoleFormatter& m_formatter;
    BuildLog& m_log;
};

} // namespace quire::application
