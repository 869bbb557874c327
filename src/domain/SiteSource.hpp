/**
 * @file SiteSource.hpp
 * @brief Interface for constructing a Site model from a project location.
 */

#pragma once
#include <string>
#include "Outcome.hpp"
#include "Site.hpp"

namespace quire::domain {

/**
 * @class SiteSource
 * @brief Abstract provider of fully-populated Site models.
 */
class SiteSource {
public:
    virtual ~SiteSource() = default;

    /**
     * @brief Builds the site model for a project.
     * @param projectPath Root directory of the project.
     * @return The site, PathNotFound when the directory is missing, or RenderError for invalid input.
     */
    virtual Outcome<Site> load(const std::string& projectPath) const = 0;
};

} // namespace quire::domain
