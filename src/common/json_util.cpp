#include "quotaswap/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace quotaswap::common {

namespace {

constexpr std::size_t MAX_NESTING = 64;

class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  bool document() {
    pos_ = json_skip_ws(text_, 0);
    if (!value(0)) {
      return false;
    }
    pos_ = json_skip_ws(text_, pos_);
    return pos_ == text_.size();
  }

private:
  bool value(const std::size_t depth) {
    if (depth > MAX_NESTING || pos_ >= text_.size()) {
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return object(depth);
    case '[':
      return array(depth);
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      return number();
    }
  }

  bool object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      pos_ = json_skip_ws(text_, pos_);
      if (!string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return false;
      }
      ++pos_;
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool string() {
    if (pos_ >= text_.size() || text_[pos_] != '"') {
      return false;
    }
    ++pos_;
    while (pos_ < text_.size()) {
      const char ch = text_[pos_];
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (static_cast<unsigned char>(ch) < 0x20) {
        return false;
      }
      if (ch == '\\') {
        ++pos_;
        if (pos_ >= text_.size()) {
          return false;
        }
        const char esc = text_[pos_];
        if (esc == 'u') {
          for (std::size_t i = 1; i <= 4; ++i) {
            if (pos_ + i >= text_.size() ||
                std::isxdigit(static_cast<unsigned char>(text_[pos_ + i])) == 0) {
              return false;
            }
          }
          pos_ += 5;
          continue;
        }
        if (std::string_view("\"\\/bfnrt").find(esc) == std::string_view::npos) {
          return false;
        }
      }
      ++pos_;
    }
    return false;
  }

  bool literal(const std::string_view word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool digits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ > start;
  }

  bool number() {
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    if (pos_ >= text_.size()) {
      return false;
    }
    if (text_[pos_] == '0') {
      ++pos_;
    } else if (!digits()) {
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) {
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      if (!digits()) {
        return false;
      }
    }
    return true;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

// End (exclusive) of the value starting at pos in an already validated document.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return pos;
  }
  switch (json[pos]) {
  case '"':
    return json_find_string_end(json, pos) + 1;
  case '{':
    return json_find_matching_token(json, pos, '{', '}') + 1;
  case '[':
    return json_find_matching_token(json, pos, '[', ']') + 1;
  default:
    break;
  }
  std::size_t end = pos;
  while (end < json.size()) {
    const char ch = json[end];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++end;
  }
  return end;
}

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  out = value;
  return true;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
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
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        std::ostringstream code;
        code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
             << static_cast<int>(static_cast<unsigned char>(ch));
        escaped += code.str();
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t code_point = 0;
      if (!read_hex4(raw, i + 1, code_point)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_number(const double value) {
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    std::ostringstream fallback;
    fallback << std::setprecision(17) << value;
    return fallback.str();
  }
  return std::string(buffer, ptr);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_is_valid(const std::string &json) { return Validator(json).document(); }

std::optional<JsonFields> json_object_fields(const std::string &json) {
  if (!json_is_valid(json)) {
    return std::nullopt;
  }
  std::size_t pos = json_skip_ws(json, 0);
  if (json[pos] != '{') {
    return std::nullopt;
  }

  JsonFields fields;
  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1) + 1; // past ':'
    pos = json_skip_ws(json, pos);
    const auto end = value_end(json, pos);
    fields.push_back(JsonField{.key = std::move(key), .raw = json.substr(pos, end - pos)});
    pos = end;
  }
  return fields;
}

std::optional<std::vector<std::string>> json_array_elements(const std::string &json) {
  if (!json_is_valid(json)) {
    return std::nullopt;
  }
  std::size_t pos = json_skip_ws(json, 0);
  if (json[pos] != '[') {
    return std::nullopt;
  }

  std::vector<std::string> elements;
  ++pos;
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (json[pos] == ']') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = value_end(json, pos);
    elements.push_back(json.substr(pos, end - pos));
    pos = end;
  }
  return elements;
}

const std::string *json_find_field(const JsonFields &fields, const std::string &key) {
  // Last occurrence wins, matching common JSON decoders.
  for (auto it = fields.rbegin(); it != fields.rend(); ++it) {
    if (it->key == key) {
      return &it->raw;
    }
  }
  return nullptr;
}

void json_set_field(JsonFields &fields, const std::string &key, std::string raw) {
  for (auto &field : fields) {
    if (field.key == key) {
      field.raw = std::move(raw);
      return;
    }
  }
  fields.push_back(JsonField{.key = key, .raw = std::move(raw)});
}

std::optional<std::string> json_string_value(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<double> json_number_value(const std::string &raw) {
  if (raw.empty() || !(raw.front() == '-' || std::isdigit(static_cast<unsigned char>(raw.front())))) {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(raw, &consumed);
    if (consumed != raw.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

bool json_is_null(const std::string &raw) { return raw == "null"; }

std::string json_render_object(const JsonFields &fields, const std::size_t indent) {
  if (fields.empty()) {
    return "{}";
  }
  const std::string pad((indent + 1) * 2, ' ');
  const std::string close_pad(indent * 2, ' ');

  std::ostringstream out;
  out << "{\n";
  for (std::size_t i = 0; i < fields.size(); ++i) {
    out << pad << json_quote(fields[i].key) << ": " << fields[i].raw;
    if (i + 1 < fields.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << close_pad << "}";
  return out.str();
}

} // namespace quotaswap::common
