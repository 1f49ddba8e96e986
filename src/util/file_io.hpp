#ifndef PIIANON_UTIL_FILE_IO_HPP
#define PIIANON_UTIL_FILE_IO_HPP

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

/**
 * @file file_io.hpp
 * @brief Whole-file reads and all-or-nothing writes for the processors.
 */

namespace piianon {
namespace util {

/**
 * @throw std::runtime_error if the file cannot be read.
 */
inline std::string readFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path + " for reading");
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("error while reading " + path);
    }
    return ss.str();
}

/**
 * @brief Write @p content to a temporary sibling of @p path, then rename it
 *        into place. Parent directories are created. On failure nothing is
 *        left at @p path and the temporary file is removed.
 * @throw std::runtime_error on any I/O failure.
 */
inline void writeFileAtomic(const std::string &path, const std::string &content)
{
    namespace fs = std::filesystem;
    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create directory " + target.parent_path().string() + ": " +
                                     ec.message());
        }
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot open " + tmp.string() + " for writing");
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw std::runtime_error("error while writing " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw std::runtime_error("cannot move " + tmp.string() + " to " + path + ": " + ec.message());
    }
}

/**
 * @brief "<dir>/<stem><suffix><ext>" beside @p input.
 */
inline std::string siblingWithSuffix(const std::string &input, const std::string &suffix)
{
    const std::filesystem::path p(input);
    return (p.parent_path() / (p.stem().string() + suffix + p.extension().string())).string();
}

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_FILE_IO_HPP
