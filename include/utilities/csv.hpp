#ifndef DOCFORENSICS_CSV_HPP
#define DOCFORENSICS_CSV_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace docforensics {

/// Quote a CSV field when it contains a separator, quote or line break.
std::string csvEscape(const std::string &field);

/// Join escaped fields into one CRLF-terminated row.
std::string csvRow(const std::vector<std::string> &fields);

/// Flatten a JSON value for a CSV cell: strings verbatim, null empty,
/// everything else as compact JSON.
std::string csvCell(const nlohmann::json &value);

} // namespace docforensics

#endif // DOCFORENSICS_CSV_HPP
