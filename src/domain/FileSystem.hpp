/**
 * @file FileSystem.hpp
 * @brief Interface to the filesystem side effects of a build.
 */

#pragma once
#include <string>
#include "Outcome.hpp"

namespace quire::domain {

/**
 * @class FileSystem
 * @brief Abstract filesystem boundary. Every failure is reported as an IOError outcome.
 *
 * Implementations must be safe to call concurrently on disjoint paths.
 */
class FileSystem {
public:
    virtual ~FileSystem() = default;

    /**
     * @brief Creates a directory and any missing parents (mkdir -p).
     * @return Success when the directory exists afterwards, including when it already existed.
     */
    virtual Status makeDirectories(const std::string& path) const = 0;

    /** @brief Reads the whole file. */
    virtual Outcome<std::string> readFile(const std::string& path) const = 0;

    /**
     * @brief Creates or overwrites a file. Parent directories are not created.
     * @param path Target file.
     * @param content Full content to store.
     */
    virtual Status writeFile(const std::string& path, const std::string& content) const = 0;

    /** @brief Copies @p source to @p destination, overwriting it. */
    virtual Status copyFile(const std::string& source, const std::string& destination) const = 0;

    /** @brief True when @p path names an existing directory. */
    virtual bool isDirectory(const std::string& path) const = 0;
};

} // namespace quire::domain
