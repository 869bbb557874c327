/**
 * @file BuildCommand.cpp
 * @brief Implementation of BuildCommand.
 */

#include "app/BuildCommand.hpp"
#include "application/BuildLog.hpp"
#include "application/BuildPipeline.hpp"
#include <exception>
#include <sstream>

namespace quire::app {

using application::BuildLog;
using application::BuildPipeline;
using domain::ErrorKind;

namespace {

// Double-quoted, with quotes and backslashes escaped.
std::string quoted(const std::string& message) {
    std::string out = "\"";
    for (char c : message) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

BuildCommand::BuildCommand(const domain::SiteSource& source,
                           const domain::FileSystem& fileSystem,
                           const domain::TemplateRenderer& templates,
                           const domain::FeedRenderer& feed,
                           const domain::ConsoleFormatter& formatter,
                           std::ostream& out,
                           std::ostream& err)
    : m_source(source),
      m_fileSystem(fileSystem),
      m_templates(templates),
      m_feed(feed),
      m_formatter(formatter),
      m_out(out),
      m_err(err) {}

BuildOptions BuildCommand::ParseArgs(const std::vector<std::string>& args) {
    BuildOptions options;
    std::vector<std::string> positionals;
    std::string projectOption;
    bool help = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            help = true;
        } else if (arg == "-p" || arg == "--project") {
            if (i + 1 >= args.size()) {
                options.action = BuildOptions::Action::Invalid;
                options.error = "Missing value for " + arg;
                return options;
            }
            projectOption = args[++i];
        } else if (arg.rfind("--project=", 0) == 0) {
            projectOption = arg.substr(std::string("--project=").size());
        } else if (arg.size() > 1 && arg[0] == '-') {
            options.action = BuildOptions::Action::Invalid;
            options.error = "Unknown option " + arg;
            return options;
        } else {
            positionals.push_back(arg);
        }
    }

    if (help || (positionals.size() == 1 && positionals[0] == "help")) {
        options.action = BuildOptions::Action::Help;
        return options;
    }
    if (positionals.size() > 1) {
        options.action = BuildOptions::Action::Invalid;
        options.error = "Expected a single project path";
        return options;
    }

    if (!positionals.empty()) {
        options.projectPath = positionals[0];
    } else if (!projectOption.empty()) {
        options.projectPath = projectOption;
    }
    return options;
}

std::string BuildCommand::Usage(const domain::ConsoleFormatter& formatter) {
    std::stringstream ss;
    ss << "builds your site\n\n"
       << "usage: quire build " << formatter.highlight("<project>") << "\n\n"
       << "options:\n"
       << "  -p, --project <path>  project directory when no positional path is given\n"
       << "  -h, --help            show this help\n";
    return ss.str();
}

int BuildCommand::execute(const std::vector<std::string>& args) const {
    auto options = ParseArgs(args);
    switch (options.action) {
        case BuildOptions::Action::Help:
            m_out << Usage(m_formatter) << std::endl;
            return 0;
        case BuildOptions::Action::Invalid:
            m_err << "[BuildCommand] " << options.error << std::endl;
            m_out << Usage(m_formatter) << std::endl;
            return 1;
        case BuildOptions::Action::Build:
            break;
    }
    return build(options.projectPath);
}

int BuildCommand::build(const std::string& projectPath) const {
    domain::Status status = domain::ok();

    try {
        auto site = m_source.load(projectPath);
        if (!site) {
            status = domain::toStatus(site);
        } else {
            BuildLog log(m_out);
            BuildPipeline pipeline(m_fileSystem, m_templates, m_feed, m_formatter, log);
            auto report = pipeline.run(site.value());
            status = report.status;
            if (!report.succeeded()) {
                m_err << "[BuildPipeline] Stopped during " << application::PhaseToString(report.phase)
                      << " phase (" << domain::BuildError::KindToString(status.error().kind) << ")" << std::endl;
            }
        }
    } catch (const std::exception& e) {
        status = domain::Status::failure(ErrorKind::RenderError, e.what());
    }

    if (status) {
        m_out << m_formatter.success("Successfully built site!") << std::endl;
        return 0;
    }

    if (status.error().kind == ErrorKind::PathNotFound) {
        m_out << "Encountered issues building site, " << m_formatter.error("Directory does not exist") << std::endl;
    } else {
        m_out << "Encountered issues building site, " << m_formatter.error(quoted(status.error().message)) << std::endl;
    }
    return 1;
}

} // namespace quire::app
