// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace kiln {
namespace server {

namespace {

std::string unquote(std::string value) {
  boost::algorithm::trim(value);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

// Split "a; b=c; d=\"e;f\"" on semicolons outside quotes
std::vector<std::string> split_params(const std::string& header) {
  std::vector<std::string> params;
  std::string current;
  bool quoted = false;
  for (char c : header) {
    if (c == '"') {
      quoted = !quoted;
    }
    if (c == ';' && !quoted) {
      params.push_back(current);
      current.clear();
    } else {
      current += c;
    }
  }
  params.push_back(current);
  return params;
}

}  // namespace

std::optional<std::string> extract_boundary(const std::string& content_type) {
  auto params = split_params(content_type);
  if (!boost::algorithm::iequals(boost::algorithm::trim_copy(params[0]), "multipart/form-data")) {
    return std::nullopt;
  }
  for (size_t i = 1; i < params.size(); ++i) {
    const std::string param = boost::algorithm::trim_copy(params[i]);
    if (boost::algorithm::istarts_with(param, "boundary=")) {
      std::string boundary = unquote(param.substr(9));
      if (boundary.empty()) {
        return std::nullopt;
      }
      return boundary;
    }
  }
  return std::nullopt;
}

bool MultipartParser::parse(
  const std::string& content_type, const std::string& body, std::vector<MultipartPart>& parts
) {
  auto boundary = extract_boundary(content_type);
  if (!boundary) {
    last_error_ = "Request is not multipart/form-data";
    return false;
  }

  const std::string delimiter = "--" + *boundary;
  const std::string next_delimiter = "\r\n" + delimiter;

  size_t pos = body.find(delimiter);
  if (pos == std::string::npos) {
    last_error_ = "Multipart boundary not found";
    return false;
  }
  pos += delimiter.size();

  while (true) {
    // Closing delimiter
    if (body.compare(pos, 2, "--") == 0) {
      return true;
    }
    if (body.compare(pos, 2, "\r\n") != 0) {
      last_error_ = "Malformed multipart delimiter line";
      return false;
    }
    pos += 2;

    size_t header_end = body.find("\r\n\r\n", pos);
    if (header_end == std::string::npos) {
      last_error_ = "Multipart part headers not terminated";
      return false;
    }

    MultipartPart part;
    if (!parse_headers(body.substr(pos, header_end - pos), part)) {
      return false;
    }

    size_t data_start = header_end + 4;
    size_t data_end = body.find(next_delimiter, data_start);
    if (data_end == std::string::npos) {
      last_error_ = "Multipart part '" + part.name + "' is not terminated";
      return false;
    }
    part.data = body.substr(data_start, data_end - data_start);
    parts.push_back(std::move(part));

    pos = data_end + next_delimiter.size();
  }
}

bool MultipartParser::parse_headers(const std::string& block, MultipartPart& part) {
  bool has_disposition = false;
  size_t start = 0;
  while (start <= block.size()) {
    size_t end = block.find("\r\n", start);
    if (end == std::string::npos) {
      end = block.size();
    }
    const std::string line = block.substr(start, end - start);
    start = end + 2;

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string name = boost::algorithm::trim_copy(line.substr(0, colon));
    const std::string value = boost::algorithm::trim_copy(line.substr(colon + 1));

    if (boost::algorithm::iequals(name, "Content-Disposition")) {
      has_disposition = true;
      for (const auto& raw : split_params(value)) {
        const std::string param = boost::algorithm::trim_copy(raw);
        if (boost::algorithm::istarts_with(param, "name=")) {
          part.name = unquote(param.substr(5));
        } else if (boost::algorithm::istarts_with(param, "filename=")) {
          part.filename = unquote(param.substr(9));
        }
      }
    } else if (boost::algorithm::iequals(name, "Content-Type")) {
      part.content_type = value;
    }
  }

  if (!has_disposition) {
    last_error_ = "Multipart part has no Content-Disposition header";
    return false;
  }
  return true;
}

const MultipartPart* find_part(const std::vector<MultipartPart>& parts, const std::string& name) {
  for (const auto& part : parts) {
    if (part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

}  // namespace server
}  // namespace kiln
