#include "utilities/csv.hpp"

namespace docforensics {

std::string csvEscape(const std::string &field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos)
    return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"')
      out += '"';
    out += c;
  }
  out += '"';
  return out;
}

std::string csvRow(const std::vector<std::string> &fields) {
  std::string row;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i)
      row += ',';
    row += csvEscape(fields[i]);
  }
  row += "\r\n";
  return row;
}

std::string csvCell(const nlohmann::json &value) {
  if (value.is_null())
    return "";
  if (value.is_string())
    return value.get<std::string>();
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace docforensics
