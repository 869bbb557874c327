/**
 * @file LocalFileSystem.cpp
 * @brief Implementation of LocalFileSystem.
 */

#include "infrastructure/LocalFileSystem.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace quire::infrastructure {

namespace fs = std::filesystem;

using domain::ErrorKind;
using domain::Outcome;
using domain::Status;

namespace {

Status ioFailure(const std::string& what, const std::string& path, const std::string& reason) {
    return Status::failure(ErrorKind::IOError, what + " " + path + ": " + reason);
}

// Unique per write, even for concurrent writes issued at the same instant.
fs::path temporarySibling(const fs::path& target) {
    static std::atomic<unsigned long long> counter{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(counter++) + ".tmp";
    return tempPath;
}

} // namespace

Status LocalFileSystem::makeDirectories(const std::string& path) const {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return ioFailure("Could not create directory", path, ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        return ioFailure("Could not create directory", path, "a file with that name exists");
    }
    return domain::ok();
}

Outcome<std::string> LocalFileSystem::readFile(const std::string& path) const {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        return Outcome<std::string>::failure(ErrorKind::IOError, "Could not read " + path + ": is a directory");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Outcome<std::string>::failure(ErrorKind::IOError, "Could not read " + path + ": cannot open file");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return Outcome<std::string>::failure(ErrorKind::IOError, "Could not read " + path + ": read error");
    }
    return Outcome<std::string>::success(buffer.str());
}

Status LocalFileSystem::writeFile(const std::string& path, const std::string& content) const {
    fs::path finalPath = path;
    fs::path tempPath = temporarySibling(finalPath);

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return ioFailure("Could not write", path, "cannot open file");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return ioFailure("Could not write", path, "write error");
        }
    }

    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return ioFailure("Could not write", path, ec.message());
    }
    return domain::ok();
}

Status LocalFileSystem::copyFile(const std::string& source, const std::string& destination) const {
    std::error_code ec;
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return ioFailure("Could not copy", source, ec.message());
    }
    return domain::ok();
}

bool LocalFileSystem::isDirectory(const std::string& path) const {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

} // namespace quire::infrastructure
