// Helpers shared by the test executables.
#pragma once

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "domain/Page.hpp"
#include "domain/Site.hpp"
#include "domain/SiteFile.hpp"

namespace quire::test {

/** @brief Scratch directory under the working directory, removed on destruction. */
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name) : m_path(std::filesystem::path("test_scratch") / name) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }
    std::string operator/(const std::string& child) const { return (m_path / child).string(); }

private:
    std::filesystem::path m_path;
};

inline void writeText(const std::string& path, const std::string& content) {
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string readText(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline domain::Page makePage(const std::string& filename, const std::string& layout,
                             const std::string& date = "", const std::string& title = "",
                             const std::string& content = "") {
    domain::Frontmatter frontmatter;
    frontmatter.layout = layout;
    frontmatter.date = date;
    frontmatter.title = title.empty() ? filename : title;
    return domain::Page(domain::SiteFile::fromPath("content/" + filename), frontmatter, content);
}

} // namespace quire::test
