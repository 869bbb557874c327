/**
 * @file LocalFileSystem.hpp
 * @brief std::filesystem implementation of the build's filesystem boundary.
 */

#pragma once
#include "domain/FileSystem.hpp"
#include <string>

namespace quire::infrastructure {

/**
 * @class LocalFileSystem
 * @brief Reads, writes and copies files on the local disk.
 *
 * Writes go to a temporary sibling file that is then renamed over the target,
 * so a failed write never leaves a truncated output behind.
 */
class LocalFileSystem : public domain::FileSystem {
public:
    domain::Status makeDirectories(const std::string& path) const override;
    domain::Outcome<std::string> readFile(const std::string& path) const override;
    domain::Status writeFile(const std::string& path, const std::string& content) const override;
    domain::Status copyFile(const std::string& source, const std::string& destination) const override;
    bool isDirectory(const std::string& path) const override;
};

} // namespace quire::infrastructure
