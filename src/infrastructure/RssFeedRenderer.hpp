/**
 * @file RssFeedRenderer.hpp
 * @brief RSS 2.0 feed generation from a site's posts.
 */

#pragma once
#include "domain/Renderers.hpp"
#include <ctime>
#include <string>

namespace quire::infrastructure {

/**
 * @class RssFeedRenderer
 * @brief Builds an RSS channel with one item per post, newest first.
 */
class RssFeedRenderer : public domain::FeedRenderer {
public:
    std::string render(const domain::Site& site) const override;

    /** @brief Converts an ISO date ("2021-06-01", time part ignored) to RFC 822; empty when unparseable or outside years 1-9999. */
    static std::string ToRfc822(const std::string& isoDate);

    /** @brief Formats a point in time as RFC 822 in GMT. */
    static std::string ToRfc822(std::time_t when);

    static std::string EscapeXml(const std::string& text);
};

} // namespace quire::infrastructure
