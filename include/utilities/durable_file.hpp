#ifndef DOCFORENSICS_DURABLE_FILE_HPP
#define DOCFORENSICS_DURABLE_FILE_HPP

#include "utilities/result.hpp"

#include <string>

namespace docforensics {

/**
 * @brief Replace @p path with @p data so that a crash leaves either the old
 * or the new contents.
 *
 * Writes a sibling temp file, fsyncs it, renames it over @p path and fsyncs
 * the parent directory. Missing parent directories are created.
 */
Result<void> writeFileDurably(const std::string &path, const std::string &data);

/**
 * @brief Append @p data to an existing file and fsync it.
 *
 * A failed write truncates the file back to its previous length, so a
 * partial record is never left behind.
 */
Result<void> appendFileDurably(const std::string &path, const std::string &data);

/// Read a whole file. A missing file yields ErrorKind::PersistenceError.
Result<std::string> readWholeFile(const std::string &path);

} // namespace docforensics

#endif // DOCFORENSICS_DURABLE_FILE_HPP
