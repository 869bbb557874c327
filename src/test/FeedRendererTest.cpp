#include <cassert>
#include <iostream>
#include <string>

#include "infrastructure/RssFeedRenderer.hpp"
#include "TestSupport.hpp"

using namespace quire::domain;
using quire::infrastructure::RssFeedRenderer;
using quire::test::makePage;

int main() {
    std::cout << "[Test] Starting Feed Renderer Test..." << std::endl;

    // Dates.
    {
        assert(RssFeedRenderer::ToRfc822("2021-06-01") == "Tue, 01 Jun 2021 00:00:00 GMT");
        assert(RssFeedRenderer::ToRfc822("2000-01-01T12:30:00") == "Sat, 01 Jan 2000 00:00:00 GMT");
        assert(RssFeedRenderer::ToRfc822("2024-02-29") == "Thu, 29 Feb 2024 00:00:00 GMT");
        assert(RssFeedRenderer::ToRfc822("yesterday").empty());
        assert(RssFeedRenderer::ToRfc822("2021-13-01").empty());
        assert(RssFeedRenderer::ToRfc822("-5-03-01").empty());
        assert(RssFeedRenderer::ToRfc822("0-01-01").empty());
        assert(RssFeedRenderer::ToRfc822("10000-01-01").empty());
        assert(RssFeedRenderer::ToRfc822("0001-01-01") == "Mon, 01 Jan 0001 00:00:00 GMT");
        assert(RssFeedRenderer::ToRfc822(std::time_t(0)) == "Thu, 01 Jan 1970 00:00:00 GMT");
    }

    assert(RssFeedRenderer::EscapeXml("a<b>&\"c'") == "a&lt;b&gt;&amp;&quot;c&apos;");

    // Channel and items, newest first.
    {
        SiteConfig config;
        config.title = "Tom & Jerry";
        config.url = "https://example.com/";
        config.description = "A blog";

        Frontmatter described;
        described.layout = "post";
        described.title = "Described";
        described.date = "2021-03-01";
        described.metadata["description"] = "Short <summary>";
        Page describedPost(SiteFile::fromPath("posts/described.md"), described, "");

        Site site(config, Theme{}, {makePage("about.md", "page", "", "About")},
                  {makePage("old.md", "post", "2020-01-01", "Old"),
                   describedPost,
                   makePage("new.md", "post", "2021-06-01", "New")});

        RssFeedRenderer renderer;
        std::string rss = renderer.render(site);

        assert(rss.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\" ?>", 0) == 0);
        assert(rss.find("<rss version=\"2.0\">") != std::string::npos);
        assert(rss.find("<title>Tom &amp; Jerry</title>") != std::string::npos);
        assert(rss.find("<description>A blog</description>") != std::string::npos);
        assert(rss.find("<lastBuildDate>") != std::string::npos);

        auto newer = rss.find("<title>New</title>");
        auto middle = rss.find("<title>Described</title>");
        auto older = rss.find("<title>Old</title>");
        assert(newer != std::string::npos && middle != std::string::npos && older != std::string::npos);
        assert(newer < middle && middle < older);

        assert(rss.find("<link>https://example.com/new.html</link>") != std::string::npos);
        assert(rss.find("<pubDate>Tue, 01 Jun 2021 00:00:00 GMT</pubDate>") != std::string::npos);
        assert(rss.find("<description>Short &lt;summary&gt;</description>") != std::string::npos);
        assert(rss.find("About") == std::string::npos);
        assert(rss.find("</channel>\n</rss>") != std::string::npos);
    }

    std::cout << "[PASS] Feed Renderer Test." << std::endl;
    return 0;
}
