/**
 * @file QuireApp.cpp
 * @brief Implementation of the QuireApp class.
 */
#include "app/QuireApp.hpp"

#include "app/BuildCommand.hpp"
#include "infrastructure/ConsoleFormatters.hpp"
#include "infrastructure/LocalFileSystem.hpp"
#include "infrastructure/RssFeedRenderer.hpp"
#include "infrastructure/SiteLoader.hpp"
#include "infrastructure/TemplateEngine.hpp"

#include <utility>

namespace quire::app {

namespace {

AppServices MakeDefaultServices() {
    AppServices services;
    services.fileSystem = std::make_unique<infrastructure::LocalFileSystem>();
    services.siteSource = std::make_unique<infrastructure::SiteLoader>(*services.fileSystem);
    services.templates = std::make_unique<infrastructure::TemplateEngine>();
    services.feed = std::make_unique<infrastructure::RssFeedRenderer>();
    services.formatter = infrastructure::MakeConsoleFormatter();
    return services;
}

} // namespace

QuireApp::QuireApp(std::ostream& out, std::ostream& err)
    : QuireApp(MakeDefaultServices(), out, err) {}

QuireApp::QuireApp(AppServices services, std::ostream& out, std::ostream& err)
    : m_services(std::move(services)), m_out(out), m_err(err) {}

int QuireApp::Run(const std::vector<std::string>& args) {
    const auto& formatter = *m_services.formatter;

    if (args.empty()) {
        m_out << BuildCommand::Usage(formatter) << std::endl;
        return 1;
    }

    const std::string& command = args.front();
    if (command == "help" || command == "-h" || command == "--help") {
        m_out << BuildCommand::Usage(formatter) << std::endl;
        return 0;
    }
    if (command != "build") {
        m_err << "[QuireApp] Unknown command " << command << std::endl;
        m_out << BuildCommand::Usage(formatter) << std::endl;
        return 1;
    }

    BuildCommand build(*m_services.siteSource, *m_services.fileSystem, *m_services.templates,
                       *m_services.feed, formatter, m_out, m_err);
    return build.execute(std::vector<std::string>(args.begin() + 1, args.end()));
}

} // namespace quire::app
