#ifndef REDACTOR_IO_DOCUMENT_IO_HPP
#define REDACTOR_IO_DOCUMENT_IO_HPP

#include <string>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <filesystem>

/**
 * @file document_io.hpp
 * @brief Whole-file reads and writes of documents. Bytes are passed through
 *        untouched (binary mode, no newline translation).
 */

namespace redactor {
namespace io {

/**
 * @throw std::runtime_error if the file cannot be opened or read.
 */
inline std::string readDocument(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("DocumentIO: cannot open " + path);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("DocumentIO: failed reading " + path);
    }
    return buffer.str();
}

/**
 * @throw std::runtime_error if the file cannot be written.
 */
inline void writeDocument(const std::string &path, const std::string &content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("DocumentIO: cannot open " + path + " for writing");
    }
    out << content;
    out.flush();
    if (!out) {
        throw std::runtime_error("DocumentIO: failed writing " + path);
    }
}

/**
 * @brief Where the redacted copy of inputPath goes inside outputDirectory.
 */
inline std::string outputPathFor(const std::string &inputPath, const std::string &outputDirectory)
{
    return (std::filesystem::path(outputDirectory) / std::filesystem::path(inputPath).filename()).string();
}

/**
 * @brief True when both paths name the same input after lexical normalization.
 */
inline bool sameDocumentPath(const std::string &a, const std::string &b)
{
    return std::filesystem::path(a).lexically_normal() == std::filesystem::path(b).lexically_normal();
}

} // namespace io
} // namespace redactor

#endif // REDACTOR_IO_DOCUMENT_IO_HPP
