/**
 * @file BuildPipeline.hpp
 * @brief Sequences the phases of a site build.
 */

#pragma once
#include <string>
#include <vector>
#include "application/BuildLog.hpp"
#include "application/PageRenderer.hpp"
#include "application/ParallelExecutor.hpp"
#include "domain/ConsoleFormatter.hpp"
#include "domain/FileSystem.hpp"
#include "domain/Outcome.hpp"
#include "domain/Renderers.hpp"
#include "domain/Site.hpp"

namespace quire::application {

/**
 * @enum BuildPhase
 * @brief States of the pipeline, in execution order.
 */
enum class BuildPhase {
    Prepare,
    Render,
    Write,
    CopyAssets,
    Feed,
    Done
};

std::string PhaseToString(BuildPhase phase);

/**
 * @struct BuildReport
 * @brief Final status of a build and the phase where it stopped (Done on success).
 */
struct BuildReport {
    BuildPhase phase = BuildPhase::Prepare;
    domain::Status status = domain::ok();

    bool succeeded() const { return status.isSuccess(); }
};

/**
 * @class BuildPipeline
 * @brief Prepare -> Render -> Write -> CopyAssets -> Feed -> Done.
 *
 * Phases run strictly in sequence. The first failing phase stops the build;
 * inside a parallel phase every item runs and all failures are aggregated.
 * Files written before a failure are left in place.
 */
class BuildPipeline {
public:
    BuildPipeline(const domain::FileSystem& fileSystem,
                  const domain::TemplateRenderer& templates,
                  const domain::FeedRenderer& feed,
                  const domain::ConsoleFormatter& formatter,
                  BuildLog& log);

    /**
     * @brief Runs every phase for @p site.
     * @param site Immutable site model; the worker cap is read from its configuration.
     */
    BuildReport run(const domain::Site& site) const;

    /** @brief Creates {out_dir}/assets and its parents; an existing directory is fine. */
    domain::Status prepareDirectories(const domain::Site& site) const;

    /** @brief Renders pages then posts in parallel. Nothing is written. */
    domain::Outcome<std::vector<domain::SiteFile>> renderPages(const domain::Site& site,
                                                               const ParallelExecutor& executor) const;

    /** @brief Writes each rendered file in parallel. */
    domain::Status writeFiles(const std::vector<domain::SiteFile>& files,
                              const ParallelExecutor& executor) const;

    /** @brief Copies each theme asset to {out_dir}/assets/{basename} in parallel. */
    domain::Status copyAssets(const domain::Site& site, const ParallelExecutor& executor) const;

    /**
     * @brief Writes {out_dir}/rss.xml when feeds are enabled and posts exist; otherwise a no-op.
     *
     * An exception from the feed renderer becomes a RenderError.
     */
    domain::Status handleFeed(const domain::Site& site) const;

    static std::string AssetPath(const domain::SiteConfig& config);
    static std::string AssetPath(const domain::SiteConfig& config, const std::string& filename);

private:
    const domain::FileSystem& m_fileSystem;
    const domain::FeedRenderer& m_feed;
    const domain::ConsoleFormatter& m_formatter;
    BuildLog& m_log;
    PageRenderer m_renderer;
};

} // namespace quire::application
