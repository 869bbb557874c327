/**
 * @file PageRenderer.cpp
 * @brief Implementation of PageRenderer.
 */

#include "application/PageRenderer.hpp"
#include "application/RenderContextBuilder.hpp"
#include <filesystem>

namespace quire::application {

using domain::ErrorKind;
using domain::Outcome;
using domain::SiteFile;

PageRenderer::PageRenderer(const domain::FileSystem& fileSystem,
                           const domain::TemplateRenderer& templates,
                           const domain::ConsoleFormatter& formatter,
                           BuildLog& log)
    : m_fileSystem(fileSystem), m_templates(templates), m_formatter(formatter), m_log(log) {}

Outcome<SiteFile> PageRenderer::render(const domain::Site& site, const domain::Page& page) const {
    const auto& pageName = page.getFile().stripped;
    m_log.line("Rendering page " + m_formatter.highlight(pageName) + "...");

    auto layoutPath = findLayout(site.getTheme().layouts, page.getFrontmatter().layout);
    if (!layoutPath) {
        return Outcome<SiteFile>::failure(layoutPath.error());
    }

    auto layout = m_fileSystem.readFile(layoutPath.value());
    if (!layout) {
        return Outcome<SiteFile>::failure(layout.error());
    }

    auto context = RenderContextBuilder::build(site, page);
    auto output = m_templates.render(layout.value(), context);
    if (!output) {
        return Outcome<SiteFile>::failure(ErrorKind::RenderError,
            "Could not render " + pageName + " with " + layoutPath.value() + ": " + output.error().message);
    }

    auto outputPath = std::filesystem::path(site.getConfig().outDir) / page.getOutputName();
    return Outcome<SiteFile>::success(SiteFile::construct(outputPath.string(), output.value()));
}

Outcome<std::string> PageRenderer::findLayout(const std::vector<SiteFile>& layouts, const std::string& name) {
    for (const auto& layout : layouts) {
        if (SiteFile::StripName(layout.basename) == name) {
            return Outcome<std::string>::success(layout.path);
        }
    }
    return Outcome<std::string>::failure(ErrorKind::LayoutNotFound, "Layout " + name + " does not exist");
}

} // namespace quire::application
