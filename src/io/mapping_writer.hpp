#ifndef REDACTOR_IO_MAPPING_WRITER_HPP
#define REDACTOR_IO_MAPPING_WRITER_HPP

#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <system_error>
#include <cctype>
#include "../engine/secret_registry.hpp"
#include "../util/logger.hpp"

/**
 * @file mapping_writer.hpp
 * @brief Persists a run's mapping so a later run can reuse it as predefined
 *        substitutions.
 *
 * One file per secret type, named after the type, each line "secret = placeholder"
 * in registration order. Point a configuration directory's `substitutions/` at
 * the output directory to get consistent placeholders across runs.
 *
 * Not every secret survives that round trip: the reader trims each line, skips
 * lines starting with '#' and reads one entry per line. Such entries are still
 * written, with a warning, since the current run's output is already correct.
 */

namespace redactor {
namespace io {

/**
 * @brief False when secretText would not be read back unchanged from a
 *        substitutions file.
 */
inline bool mappingRoundTrips(const std::string &secretText)
{
    if (secretText.empty() || secretText[0] == '#') {
        return false;
    }
    if (std::isspace(static_cast<unsigned char>(secretText.front())) ||
        std::isspace(static_cast<unsigned char>(secretText.back()))) {
        return false;
    }
    return secretText.find_first_of("\r\n") == std::string::npos;
}

/**
 * @brief Render the lines of one secret type's mapping file.
 */
inline std::string formatMapping(const std::vector<engine::MappingEntry> &entries,
                                 const std::string &secretType)
{
    std::string out;
    for (const auto &entry : entries) {
        if (entry.secretType == secretType) {
            out += entry.secretText + " = " + entry.placeholder + "\n";
        }
    }
    return out;
}

/**
 * @brief Write one mapping file per secret type present in entries.
 * @param secretTypes Names to write even when they have no entries (empty file).
 * @return Paths written, in secret-type name order.
 * @throw std::runtime_error if the directory cannot be created or a file cannot be written.
 */
inline std::vector<std::string> writeMappingFiles(const std::string &directory,
                                                  const std::vector<engine::MappingEntry> &entries,
                                                  const std::vector<std::string> &secretTypes = {})
{
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("MappingWriter: cannot create " + directory + ": " + ec.message());
    }

    std::map<std::string, std::string> files;
    for (const auto &name : secretTypes) {
        files.emplace(name, "");
    }
    for (const auto &entry : entries) {
        files.emplace(entry.secretType, "");
    }

    for (const auto &entry : entries) {
        if (!mappingRoundTrips(entry.secretText)) {
            util::logger::warn("MappingWriter: a " + entry.secretType + " secret mapped to " +
                               entry.placeholder + " will not be read back from the mapping file");
        }
    }

    std::vector<std::string> written;
    for (auto &file : files) {
        file.second = formatMapping(entries, file.first);
        std::filesystem::path path = std::filesystem::path(directory) / file.first;
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("MappingWriter: cannot open " + path.string() + " for writing");
        }
        out << file.second;
        out.flush();
        if (!out) {
            throw std::runtime_error("MappingWriter: failed writing " + path.string());
        }
        written.push_back(path.string());
        util::logger::info("MappingWriter: wrote " + path.string());
    }
    return written;
}

} // namespace io
} // namespace redactor

#endif // REDACTOR_IO_MAPPING_WRITER_HPP
