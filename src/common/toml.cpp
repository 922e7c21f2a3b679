#include "newsdesk/common/toml.hpp"

#include "newsdesk/common/fs.hpp"

#include <charconv>
#include <cstdlib>
#include <optional>
#include <sstream>

namespace newsdesk::common {

namespace {

// Index of the quote closing the string opened at `open`, or npos.
std::size_t closing_quote(const std::string &text, const std::size_t open) {
  for (std::size_t i = open + 1; i < text.size(); ++i) {
    if (text[i] == '\\') {
      ++i;
    } else if (text[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

Result<std::string> strip_comment(const std::string &line) {
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') {
      i = closing_quote(line, i);
      if (i == std::string::npos) {
        return Result<std::string>::failure("unterminated string");
      }
    } else if (line[i] == '#') {
      return Result<std::string>::success(line.substr(0, i));
    }
  }
  return Result<std::string>::success(line);
}

// Basic strings only: \" \\ \n \t.
std::optional<std::string> parse_basic_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || closing_quote(raw, 0) != raw.size() - 1) {
    return std::nullopt;
  }
  std::string out;
  for (std::size_t i = 1; i + 1 < raw.size(); ++i) {
    if (raw[i] != '\\') {
      out.push_back(raw[i]);
      continue;
    }
    const char escaped = raw[++i];
    out.push_back(escaped == 'n' ? '\n' : escaped == 't' ? '\t' : escaped);
  }
  return out;
}

std::vector<std::string> split_array(const std::string &body) {
  std::vector<std::string> elements;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= body.size(); ++i) {
    if (i < body.size() && body[i] == '"') {
      i = closing_quote(body, i);
      if (i == std::string::npos) {
        break;
      }
      continue;
    }
    if (i == body.size() || body[i] == ',') {
      const std::string element = trim(body.substr(start, i - start));
      if (!element.empty()) {
        elements.push_back(element);
      }
      start = i + 1;
    }
  }
  return elements;
}

Result<TomlDocument> line_error(const std::string &what, const std::size_t line_number) {
  return Result<TomlDocument>::failure(ErrorCode::ConfigurationError,
                                       what + " at line " + std::to_string(line_number));
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return parse_basic_string(it->second).value_or(it->second);
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string &text = it->second;
  std::uint64_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(it->second.c_str(), &end);
  return end == it->second.c_str() + it->second.size() ? parsed : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string &raw = it->second;
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> out;
  for (const auto &element : split_array(raw.substr(1, raw.size() - 2))) {
    auto value = parse_basic_string(element);
    if (!value) {
      return fallback;
    }
    out.push_back(std::move(*value));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    auto stripped = strip_comment(line);
    if (!stripped.ok()) {
      return line_error("Unterminated string", line_number);
    }
    const std::string clean = trim(stripped.value());
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return line_error("Invalid empty section", line_number);
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return line_error("Invalid key/value", line_number);
    }
    const std::string key = trim(clean.substr(0, equals));
    if (key.empty()) {
      return line_error("Missing key", line_number);
    }
    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, trim(clean.substr(equals + 1))).second) {
      return line_error("Duplicate key '" + full_key + "'", line_number);
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace newsdesk::common
