#include <cassert>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "infrastructure/TemplateEngine.hpp"

using json = nlohmann::json;
using quire::domain::ErrorKind;
using quire::infrastructure::TemplateEngine;

namespace {

std::string renderOk(const TemplateEngine& engine, const std::string& text, const json& context) {
    auto result = engine.render(text, context);
    assert(result.isSuccess());
    return result.value();
}

} // namespace

int main() {
    std::cout << "[Test] Starting Template Engine Test..." << std::endl;

    TemplateEngine engine;

    // Variables, raw and escaped output.
    {
        json context = {{"name", "<b>Ann & Bob</b>"}, {"count", 3}, {"flag", true}};
        assert(renderOk(engine, "Hi {{ name }}!", context) == "Hi <b>Ann & Bob</b>!");
        assert(renderOk(engine, "{{ escape(name) }}", context) == "&lt;b&gt;Ann &amp; Bob&lt;/b&gt;");
        assert(renderOk(engine, "{{ count }}/{{ flag }}", context) == "3/true");
        assert(renderOk(engine, "{{ escape(count) }}", context) == "3");
        assert(renderOk(engine, "no tags at all", context) == "no tags at all");
        assert(renderOk(engine, "a{# ignored #}b", context) == "ab");
    }

    // Dotted names and the page context shape.
    {
        json context = {{"page", {{"frontmatter", {{"title", "Hello"}}}, {"content", "<p>x</p>"}}}};
        assert(renderOk(engine, "<h1>{{ page.frontmatter.title }}</h1>{{ page.content }}", context)
               == "<h1>Hello</h1><p>x</p>");
        assert(renderOk(engine, "{% if existsIn(page, \"subtitle\") %}sub{% else %}none{% endif %}", context)
               == "none");
    }

    // Loops and conditions.
    {
        json context = {
            {"posts", json::array({{{"title", "B"}}, {{"title", "A"}}})},
            {"empty", json::array()},
            {"on", true},
            {"off", false}
        };
        assert(renderOk(engine, "{% for post in posts %}<li>{{ post.title }}</li>{% endfor %}", context)
               == "<li>B</li><li>A</li>");
        assert(renderOk(engine, "{% for post in posts %}{{ loop.index }}{% endfor %}", context) == "01");
        assert(renderOk(engine, "{% if on %}yes{% endif %}{% if off %}no{% endif %}", context) == "yes");
        assert(renderOk(engine, "{% if length(empty) == 0 %}none{% endif %}", context) == "none");
    }

    // Template problems are reported, not thrown.
    {
        json context = {{"x", "1"}};
        auto missing = engine.render("[{{ nope }}]", context);
        assert(missing.isFailure());
        assert(missing.error().kind == ErrorKind::RenderError);
        assert(missing.error().message.find("nope") != std::string::npos);

        auto unterminated = engine.render("a {{ x", context);
        assert(unterminated.isFailure());
        assert(unterminated.error().kind == ErrorKind::RenderError);

        auto unclosed = engine.render("{% if x %}open", context);
        assert(unclosed.isFailure());
    }

    // Structured values holding invalid UTF-8 still render.
    {
        json context = {{"page", {{"content", "caf\xE9"}}}};
        auto whole = engine.render("{{ page }}", context);
        assert(whole.isSuccess());
        assert(whole.value().find("caf\xEF\xBF\xBD") != std::string::npos);

        auto escaped = engine.render("{{ escape(page) }}", context);
        assert(escaped.isSuccess());
        assert(escaped.value().find("&quot;content&quot;") != std::string::npos);

        auto sanitized = TemplateEngine::SanitizeUtf8(context);
        assert(sanitized["page"]["content"] == "caf\xEF\xBF\xBD");
    }

    assert(TemplateEngine::EscapeHtml("\"it's\"") == "&quot;it&#39;s&quot;");

    std::cout << "[PASS] Template Engine Test." << std::endl;
    return 0;
}
