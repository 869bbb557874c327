/**
 * @file SiteLoader.hpp
 * @brief Filesystem-based construction of the Site model from a project directory.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/FileSystem.hpp"
#include "domain/SiteSource.hpp"

namespace quire::infrastructure {

/**
 * @class SiteLoader
 * @brief Reads a project laid out as:
 *
 *     config.json            site configuration (optional)
 *     pages/                 content pages
 *     posts/                 dated content posts
 *     theme/                 or themes/<config.theme>/
 *       layouts/             layout templates
 *       assets/              static files copied verbatim
 *
 * Directory entries are taken in file name order.
 */
class SiteLoader : public domain::SiteSource {
public:
    explicit SiteLoader(const domain::FileSystem& fileSystem);

    /** @brief Loads the project. @see domain::SiteSource::load */
    domain::Outcome<domain::Site> load(const std::string& projectPath) const override;

private:
    const domain::FileSystem& m_fileSystem;

    /** @brief Regular files directly inside @p directory; an absent directory yields none. */
    domain::Outcome<std::vector<domain::SiteFile>> listFiles(const std::string& directory) const;

    domain::Outcome<std::vector<domain::Page>> loadPages(const std::string& directory,
                                                         const std::string& defaultLayout,
                                                         bool requireDate) const;
};

} // namespace quire::infrastructure
