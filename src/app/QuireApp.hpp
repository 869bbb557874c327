/**
 * @file QuireApp.hpp
 * @brief Command-line entry point for Quire.
 */

#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "domain/ConsoleFormatter.hpp"
#include "domain/FileSystem.hpp"
#include "domain/Renderers.hpp"
#include "domain/SiteSource.hpp"

namespace quire::app {

/**
 * @struct AppServices
 * @brief Collaborators shared by the subcommands.
 */
struct AppServices {
    std::unique_ptr<domain::FileSystem> fileSystem;
    std::unique_ptr<domain::SiteSource> siteSource;
    std::unique_ptr<domain::TemplateRenderer> templates;
    std::unique_ptr<domain::FeedRenderer> feed;
    std::unique_ptr<domain::ConsoleFormatter> formatter;
};

/**
 * @class QuireApp
 * @brief Composition root and subcommand dispatch.
 */
class QuireApp {
public:
    /** @brief Wires the local filesystem, site loader, template engine and RSS renderer. */
    QuireApp(std::ostream& out, std::ostream& err);

    /** @brief Uses the given collaborators instead of the defaults. */
    QuireApp(AppServices services, std::ostream& out, std::ostream& err);

    /**
     * @brief Dispatches "build" and "help".
     * @param args Command-line arguments without the program name.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

private:
    AppServices m_services;
    std::ostream& m_out;
    std::ostream& m_err;
};

} // namespace quire::app
