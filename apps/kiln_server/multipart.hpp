// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_SERVER_MULTIPART_HPP
#define KILN_SERVER_MULTIPART_HPP

#include <optional>
#include <string>
#include <vector>

namespace kiln {
namespace server {

/**
 * One part of a multipart/form-data body
 */
struct MultipartPart {
  std::string name;          // form field name
  std::string filename;      // empty for plain fields
  std::string content_type;  // empty when the part carries none
  std::string data;
};

/**
 * Boundary parameter of a multipart/form-data Content-Type header,
 * with surrounding quotes removed.
 *
 * @return std::nullopt if the header is not multipart/form-data or has no boundary
 */
std::optional<std::string> extract_boundary(const std::string& content_type);

/**
 * Parser for complete in-memory multipart/form-data bodies.
 */
class MultipartParser {
public:
  MultipartParser() = default;

  /**
   * Split `body` into parts.
   *
   * @param content_type Value of the request Content-Type header
   * @return false on malformed input, see get_last_error()
   */
  bool parse(const std::string& content_type, const std::string& body, std::vector<MultipartPart>& parts);

  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_headers(const std::string& block, MultipartPart& part);

  std::string last_error_;
};

/**
 * First part named `name`, or nullptr
 */
const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name);

}  // namespace server
}  // namespace kiln

#endif  // KILN_SERVER_MULTIPART_HPP
