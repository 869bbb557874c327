/**
 * @file BuildPipeline.cpp
 * @brief Implementation of BuildPipeline.
 */

#include "application/BuildPipeline.hpp"
#include "application/OutcomeAggregator.hpp"
#include <exception>
#include <filesystem>
#include <variant>

namespace quire::application {

namespace fs = std::filesystem;

using domain::Outcome;
using domain::SiteFile;
using domain::Status;

std::string PhaseToString(BuildPhase phase) {
    switch (phase) {
        case BuildPhase::Prepare: return "Prepare";
        case BuildPhase::Render: return "Render";
        case BuildPhase::Write: return "Write";
        case BuildPhase::CopyAssets: return "CopyAssets";
        case BuildPhase::Feed: return "Feed";
        case BuildPhase::Done: return "Done";
    }
    return "Prepare";
}

BuildPipeline::BuildPipeline(const domain::FileSystem& fileSystem,
                             const domain::TemplateRenderer& templates,
                             const domain::FeedRenderer& feed,
                             const domain::ConsoleFormatter& formatter,
                             BuildLog& log)
    : m_fileSystem(fileSystem),
      m_feed(feed),
      m_formatter(formatter),
      m_log(log),
      m_renderer(fileSystem, templates, formatter, log) {}

BuildReport BuildPipeline::run(const domain::Site& site) const {
    ParallelExecutor executor(site.getConfig().maxWorkers);
    BuildReport report;

    report.phase = BuildPhase::Prepare;
    report.status = prepareDirectories(site);
    if (!report.status) return report;

    report.phase = BuildPhase::Render;
    auto rendered = renderPages(site, executor);
    if (!rendered) {
        report.status = domain::toStatus(rendered);
        return report;
    }

    report.phase = BuildPhase::Write;
    report.status = writeFiles(rendered.value(), executor);
    if (!report.status) return report;

    report.phase = BuildPhase::CopyAssets;
    report.status = copyAssets(site, executor);
    if (!report.status) return report;

    report.phase = BuildPhase::Feed;
    report.status = handleFeed(site);
    if (!report.status) return report;

    report.phase = BuildPhase::Done;
    return report;
}

Status BuildPipeline::prepareDirectories(const domain::Site& site) const {
    // Creating the assets directory also creates the output directory above it.
    return m_fileSystem.makeDirectories(AssetPath(site.getConfig()));
}

Outcome<std::vector<SiteFile>> BuildPipeline::renderPages(const domain::Site& site,
                                                          const ParallelExecutor& executor) const {
    auto outcomes = executor.map(site.getAllPages(), [this, &site](const domain::Page& page) {
        return m_renderer.render(site, page);
    });
    return collectOutcomes(outcomes);
}

Status BuildPipeline::writeFiles(const std::vector<SiteFile>& files, const ParallelExecutor& executor) const {
    auto outcomes = executor.map(files, [this](const SiteFile& file) {
        m_log.line("Writing " + m_formatter.highlight(file.path) + "...");
        return m_fileSystem.writeFile(file.path, file.content);
    });
    return domain::toStatus(collectOutcomes(outcomes));
}

Status BuildPipeline::copyAssets(const domain::Site& site, const ParallelExecutor& executor) const {
    const auto& config = site.getConfig();
    auto outcomes = executor.map(site.getTheme().assets, [this, &config](const SiteFile& asset) {
        m_log.line("Writing " + m_formatter.highlight(asset.path) + "...");
        return m_fileSystem.copyFile(asset.path, AssetPath(config, asset.basename));
    });
    return domain::toStatus(collectOutcomes(outcomes));
}

Status BuildPipeline::handleFeed(const domain::Site& site) const {
    const auto& config = site.getConfig();
    if (!config.generateRss || site.getPosts().empty()) {
        return domain::ok();
    }

    std::string feed;
    try {
        feed = m_feed.render(site);
    } catch (const std::exception& e) {
        return Status::failure(domain::ErrorKind::RenderError, std::string("Could not render feed: ") + e.what());
    }
    std::string path = (fs::path(config.outDir) / "rss.xml").string();
    m_log.line("Writing " + m_formatter.highlight(path) + "...");
    return m_fileSystem.writeFile(path, feed);
}

std::string BuildPipeline::AssetPath(const domain::SiteConfig& config) {
    return (fs::path(config.outDir) / "assets").string();
}

std::string BuildPipeline::AssetPath(const domain::SiteConfig& config, const std::string& filename) {
    return (fs::path(config.outDir) / "assets" / filename).string();
}

} // namespace quire::application
