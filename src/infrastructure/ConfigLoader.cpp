/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <filesystem>
#include <fstream>

namespace quire::infrastructure {

namespace fs = std::filesystem;
using json = nlohmann::json;
using domain::ErrorKind;
using domain::Outcome;
using domain::SiteConfig;

namespace {

std::string resolveOutDir(const std::string& projectRoot, const std::string& outDir) {
    fs::path out(outDir);
    if (out.is_absolute()) {
        return out.lexically_normal().string();
    }
    return (fs::path(projectRoot) / out).lexically_normal().string();
}

} // namespace

Outcome<SiteConfig> ConfigLoader::Load(const std::string& projectRoot) {
    fs::path configPath = fs::path(projectRoot) / FileName;
    std::error_code ec;
    if (!fs::exists(configPath, ec)) {
        return FromJson(json::object(), projectRoot);
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        return Outcome<SiteConfig>::failure(ErrorKind::IOError, "Could not read " + configPath.string());
    }

    try {
        json document = json::parse(f);
        return FromJson(document, projectRoot);
    } catch (const json::exception& e) {
        return Outcome<SiteConfig>::failure(ErrorKind::RenderError,
                                            "Invalid " + std::string(FileName) + ": " + e.what());
    }
}

Outcome<SiteConfig> ConfigLoader::FromJson(const json& document, const std::string& projectRoot) {
    if (!document.is_object()) {
        return Outcome<SiteConfig>::failure(ErrorKind::RenderError,
                                            std::string("Invalid ") + FileName + ": expected an object");
    }

    SiteConfig config;
    try {
        config.outDir = resolveOutDir(projectRoot, document.value("out_dir", std::string(DefaultOutDir)));
        config.generateRss = document.value("generate_rss", false);
        config.title = document.value("title", "");
        config.description = document.value("description", "");
        config.url = document.value("url", "");
        config.author = document.value("author", "");
        config.theme = document.value("theme", "");

        if (document.contains("max_workers")) {
            const auto& workers = document["max_workers"];
            if (!workers.is_number_integer() || workers.get<long long>() < 0) {
                return Outcome<SiteConfig>::failure(ErrorKind::RenderError,
                    std::string("Invalid ") + FileName + ": max_workers must be a non-negative integer");
            }
            config.maxWorkers = workers.get<std::size_t>();
        }
    } catch (const json::exception& e) {
        return Outcome<SiteConfig>::failure(ErrorKind::RenderError,
                                            std::string("Invalid ") + FileName + ": " + e.what());
    }

    config.extra = document;
    for (const char* key : {"out_dir", "generate_rss", "title", "description", "url", "author", "theme", "max_workers"}) {
        config.extra.erase(key);
    }
    return Outcome<SiteConfig>::success(config);
}

} // namespace quire::infrastructure
