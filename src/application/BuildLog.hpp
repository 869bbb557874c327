/**
 * @file BuildLog.hpp
 * @brief Line-oriented console sink shared by concurrent build workers.
 */

#pragma once
#include <mutex>
#include <ostream>
#include <string>

namespace quire::application {

/**
 * @class BuildLog
 * @brief Writes whole lines to a stream; lines from different workers never interleave.
 */
class BuildLog {
public:
    explicit BuildLog(std::ostream& out) : m_out(out) {}

    BuildLog(const BuildLog&) = delete;
    BuildLog& operator=(const BuildLog&) = delete;

    void line(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_out << text << std::endl;
    }

private:
    std::ostream& m_out;
    std::mutex m_mutex;
};

} // namespace quire::application
