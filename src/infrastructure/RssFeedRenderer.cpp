/**
 * @file RssFeedRenderer.cpp
 * @brief Implementation of RssFeedRenderer.
 */

#include "infrastructure/RssFeedRenderer.hpp"
#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>
#include <vector>

namespace quire::infrastructure {

namespace {

const std::array<const char*, 7> kDays = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
const std::array<const char*, 12> kMonths = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                             "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};

// Sakamoto's method, 0 = Sunday.
int dayOfWeek(int year, int month, int day) {
    static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    if (month < 3) year -= 1;
    int weekday = (year + year / 4 - year / 100 + year / 400 + offsets[month - 1] + day) % 7;
    return (weekday + 7) % 7;
}

std::string formatRfc822(int year, int month, int day, int hour, int minute, int second, int weekday) {
    std::stringstream out;
    out << kDays.at(weekday) << ", "
        << std::setfill('0') << std::setw(2) << day << ' '
        << kMonths.at(month - 1) << ' '
        << std::setw(4) << year << ' '
        << std::setw(2) << hour << ':'
        << std::setw(2) << minute << ':'
        << std::setw(2) << second << " GMT";
    return out.str();
}

std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (base.back() == '/') return base + path;
    return base + "/" + path;
}

std::string itemDescription(const domain::Frontmatter& frontmatter) {
    for (const char* key : {"description", "summary"}) {
        auto it = frontmatter.metadata.find(key);
        if (it != frontmatter.metadata.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // namespace

std::string RssFeedRenderer::render(const domain::Site& site) const {
    const auto& config = site.getConfig();

    std::vector<const domain::Page*> posts;
    for (const auto& post : site.getPosts()) {
        posts.push_back(&post);
    }
    std::stable_sort(posts.begin(), posts.end(), [](const domain::Page* left, const domain::Page* right) {
        return left->getFrontmatter().date > right->getFrontmatter().date;
    });

    std::stringstream out;
    out << R"(<?xml version="1.0" encoding="UTF-8" ?>)" << "\n"
        << R"(<rss version="2.0">)" << "\n"
        << "<channel>\n"
        << "<title>" << EscapeXml(config.title) << "</title>\n"
        << "<link>" << EscapeXml(config.url) << "</link>\n"
        << "<description>" << EscapeXml(config.description) << "</description>\n"
        << "<lastBuildDate>" << ToRfc822(std::time(nullptr)) << "</lastBuildDate>\n";

    for (const auto* post : posts) {
        const auto& frontmatter = post->getFrontmatter();
        const auto link = joinUrl(config.url, post->getOutputName());

        out << "<item>\n"
            << " <title>" << EscapeXml(frontmatter.title) << "</title>\n"
            << " <link>" << EscapeXml(link) << "</link>\n"
            << R"( <guid isPermaLink="true">)" << EscapeXml(link) << "</guid>\n";
        const auto pubDate = ToRfc822(frontmatter.date);
        if (!pubDate.empty()) {
            out << " <pubDate>" << pubDate << "</pubDate>\n";
        }
        const auto description = itemDescription(frontmatter);
        if (!description.empty()) {
            out << " <description>" << EscapeXml(description) << "</description>\n";
        }
        out << "</item>\n";
    }

    out << "</channel>\n"
        << "</rss>\n";
    return out.str();
}

std::string RssFeedRenderer::ToRfc822(const std::string& isoDate) {
    int year = 0, month = 0, day = 0;
    char dash1 = 0, dash2 = 0;
    std::istringstream in(isoDate);
    in >> year >> dash1 >> month >> dash2 >> day;
    if (in.fail() || dash1 != '-' || dash2 != '-' || year < 1 || year > 9999 ||
        month < 1 || month > 12 || day < 1 || day > 31) {
        return "";
    }
    return formatRfc822(year, month, day, 0, 0, 0, dayOfWeek(year, month, day));
}

std::string RssFeedRenderer::ToRfc822(std::time_t when) {
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &when);
#else
    gmtime_r(&when, &utc);
#endif
    return formatRfc822(utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                        utc.tm_hour, utc.tm_min, utc.tm_sec, utc.tm_wday);
}

std::string RssFeedRenderer::EscapeXml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&apos;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

} // namespace quire::infrastructure
