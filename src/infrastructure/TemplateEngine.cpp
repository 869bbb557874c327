/**
 * @file TemplateEngine.cpp
 * @brief Implementation of TemplateEngine.
 */

#include "infrastructure/TemplateEngine.hpp"
#include <inja/inja.hpp>

namespace quire::infrastructure {

using json = nlohmann::json;
using domain::ErrorKind;
using domain::Outcome;

namespace {

std::string dumpLenient(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

inja::Environment makeEnvironment() {
    inja::Environment env;
    env.add_callback("escape", 1, [](inja::Arguments& args) {
        const json* value = args.at(0);
        if (value->is_string()) {
            return json(TemplateEngine::EscapeHtml(value->get<std::string>()));
        }
        return json(TemplateEngine::EscapeHtml(value->is_null() ? "" : dumpLenient(*value)));
    });
    return env;
}

std::string renderWith(const std::string& templateText, const json& context) {
    inja::Environment env = makeEnvironment();
    return env.render(templateText, context);
}

} // namespace

Outcome<std::string> TemplateEngine::render(const std::string& templateText, const json& context) const {
    try {
        return Outcome<std::string>::success(renderWith(templateText, context));
    } catch (const inja::InjaError& e) {
        return Outcome<std::string>::failure(ErrorKind::RenderError, e.what());
    } catch (const json::type_error&) {
        // Objects and arrays are printed through a strict dump, which rejects invalid UTF-8.
    }

    try {
        return Outcome<std::string>::success(renderWith(templateText, SanitizeUtf8(context)));
    } catch (const std::exception& e) {
        return Outcome<std::string>::failure(ErrorKind::RenderError, e.what());
    }
}

std::string TemplateEngine::EscapeHtml(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            case '\'': escaped += "&#39;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

json TemplateEngine::SanitizeUtf8(const json& context) {
    return json::parse(dumpLenient(context));
}

} // namespace quire::infrastructure
