/**
 * @file SiteLoader.cpp
 * @brief Implementation of SiteLoader.
 */

#include "infrastructure/SiteLoader.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FrontmatterParser.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace quire::infrastructure {

using domain::ErrorKind;
using domain::Outcome;
using domain::Page;
using domain::Site;
using domain::SiteFile;

SiteLoader::SiteLoader(const domain::FileSystem& fileSystem)
    : m_fileSystem(fileSystem) {}

Outcome<Site> SiteLoader::load(const std::string& projectPath) const {
    if (!m_fileSystem.isDirectory(projectPath)) {
        return Outcome<Site>::failure(ErrorKind::PathNotFound, "Directory does not exist");
    }

    auto config = ConfigLoader::Load(projectPath);
    if (!config) {
        return Outcome<Site>::failure(config.error());
    }

    fs::path themeDir = config.value().theme.empty()
        ? fs::path(projectPath) / "theme"
        : fs::path(projectPath) / "themes" / config.value().theme;

    auto layouts = listFiles((themeDir / "layouts").string());
    if (!layouts) return Outcome<Site>::failure(layouts.error());
    if (layouts.value().empty()) {
        std::cerr << "[SiteLoader] No layouts found in " << (themeDir / "layouts").string() << std::endl;
    }

    auto assets = listFiles((themeDir / "assets").string());
    if (!assets) return Outcome<Site>::failure(assets.error());

    auto pages = loadPages((fs::path(projectPath) / "pages").string(), "page", false);
    if (!pages) return Outcome<Site>::failure(pages.error());

    auto posts = loadPages((fs::path(projectPath) / "posts").string(), "post", true);
    if (!posts) return Outcome<Site>::failure(posts.error());

    domain::Theme theme{layouts.value(), assets.value()};
    return Outcome<Site>::success(Site(config.value(), theme, pages.value(), posts.value()));
}

Outcome<std::vector<SiteFile>> SiteLoader::listFiles(const std::string& directory) const {
    std::vector<SiteFile> files;
    if (!m_fileSystem.isDirectory(directory)) {
        return Outcome<std::vector<SiteFile>>::success(files);
    }

    try {
        for (const auto& entry : fs::directory_iterator(directory)) {
            if (entry.is_regular_file()) {
                files.push_back(SiteFile::fromPath(entry.path().string()));
            }
        }
    } catch (const fs::filesystem_error& e) {
        return Outcome<std::vector<SiteFile>>::failure(ErrorKind::IOError,
            "Could not list " + directory + ": " + e.code().message());
    }

    std::sort(files.begin(), files.end(), [](const SiteFile& left, const SiteFile& right) {
        return left.basename < right.basename;
    });
    return Outcome<std::vector<SiteFile>>::success(files);
}

Outcome<std::vector<Page>> SiteLoader::loadPages(const std::string& directory,
                                                 const std::string& defaultLayout,
                                                 bool requireDate) const {
    auto sources = listFiles(directory);
    if (!sources) {
        return Outcome<std::vector<Page>>::failure(sources.error());
    }

    std::vector<Page> pages;
    for (const auto& source : sources.value()) {
        auto text = m_fileSystem.readFile(source.path);
        if (!text) {
            return Outcome<std::vector<Page>>::failure(text.error());
        }

        auto parsed = FrontmatterParser::Parse(text.value(), defaultLayout);
        if (requireDate && parsed.frontmatter.date.empty()) {
            return Outcome<std::vector<Page>>::failure(ErrorKind::RenderError,
                "Post " + source.basename + " has no date");
        }
        pages.emplace_back(source, parsed.frontmatter, parsed.body);
    }
    return Outcome<std::vector<Page>>::success(pages);
}

} // namespace quire::infrastructure
