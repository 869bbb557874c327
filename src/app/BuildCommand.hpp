/**
 * @file BuildCommand.hpp
 * @brief The "build" subcommand: argument handling, build run and final status line.
 */

#pragma once

#include <ostream>
#include <string>
#include <vector>
#include "domain/ConsoleFormatter.hpp"
#include "domain/FileSystem.hpp"
#include "domain/Renderers.hpp"
#include "domain/SiteSource.hpp"

namespace quire::app {

/**
 * @struct BuildOptions
 * @brief Parsed arguments of the build subcommand.
 */
struct BuildOptions {
    enum class Action { Build, Help, Invalid };

    Action action = Action::Build;
    std::string projectPath = ".";
    std::string error; ///< Reason when action is Invalid.
};

/**
 * @class BuildCommand
 * @brief Loads a site, runs the build pipeline and reports exactly one final line.
 */
class BuildCommand {
public:
    BuildCommand(const domain::SiteSource& source,
                 const domain::FileSystem& fileSystem,
                 const domain::TemplateRenderer& templates,
                 const domain::FeedRenderer& feed,
                 const domain::ConsoleFormatter& formatter,
                 std::ostream& out,
                 std::ostream& err);

    /**
     * @brief Parses the arguments that follow "build".
     *
     * Accepts one optional positional path, -p/--project <path> (used only when
     * no positional path is given) and -h/--help. A lone "help" positional also
     * requests help.
     */
    static BuildOptions ParseArgs(const std::vector<std::string>& args);

    static std::string Usage(const domain::ConsoleFormatter& formatter);

    /**
     * @brief Runs the subcommand.
     * @return 0 on success or help, 1 on invalid arguments or a failed build.
     */
    int execute(const std::vector<std::string>& args) const;

    /** @brief Builds the project at @p projectPath and prints the final line. */
    int build(const std::string& projectPath) const;

private:
    const domain::SiteSource& m_source;
    const domain::FileSystem& m_fileSystem;
    const domain::TemplateRenderer& m_templates;
    const domain::FeedRenderer& m_feed;
    const domain::ConsoleFormatter& m_formatter;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace quire::app
