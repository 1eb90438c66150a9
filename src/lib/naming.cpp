#include <thriftgen/naming.hpp>

#include <unordered_set>

namespace thriftgen {

  namespace {

    const std::string qualifier_separator = "::";

    bool
    is_upper(char c) {
      return c >= 'A' && c <= 'Z';
    }

    bool
    is_lower(char c) {
      return c >= 'a' && c <= 'z';
    }

    char
    to_lower(char c) {
      if (is_upper(c)) return static_cast<char>(c - 'A' + 'a');
      return c;
    }

    char
    to_upper(char c) {
      if (is_lower(c)) return static_cast<char>(c - 'a' + 'A');
      return c;
    }

    const std::unordered_set<std::string>&
    cpp_keywords() {
      static const std::unordered_set<std::string> keywords = {
          "alignas",       "alignof",     "and",
          "and_eq",        "asm",         "auto",
          "bitand",        "bitor",       "bool",
          "break",         "case",        "catch",
          "char",          "char8_t",     "char16_t",
          "char32_t",      "class",       "compl",
          "concept",       "const",       "consteval",
          "constexpr",     "constinit",   "const_cast",
          "continue",      "co_await",    "co_return",
          "co_yield",      "decltype",    "default",
          "delete",        "do",          "double",
          "dynamic_cast",  "else",        "enum",
          "explicit",      "export",      "extern",
          "false",         "float",       "for",
          "friend",        "goto",        "if",
          "inline",        "int",         "long",
          "mutable",       "namespace",   "new",
          "noexcept",      "not",         "not_eq",
          "nullptr",       "operator",    "or",
          "or_eq",         "private",     "protected",
          "public",        "register",    "reinterpret_cast",
          "requires",      "return",      "short",
          "signed",        "sizeof",      "static",
          "static_assert", "static_cast", "struct",
          "switch",        "template",    "this",
          "thread_local",  "throw",       "true",
          "try",           "typedef",     "typeid",
          "typename",      "union",       "unsigned",
          "using",         "virtual",     "void",
          "volatile",      "wchar_t",     "while",
          "xor",           "xor_eq",
      };
      return keywords;
    }

  } // namespace

  std::string
  to_snake_case(std::string_view name) {
    if (name.empty()) return {};

    std::string result;
    result.reserve(name.size() + 4);

    for (std::size_t i = 0; i < name.size(); ++i) {
      char c = name[i];

      if (c == '-' || c == '.') {
        result += '_';
        continue;
      }

      if (is_upper(c)) {
        // Word boundary: "pointX" -> "point_x", the 'P' in "HTTPPoint"
        if (!result.empty() && result.back() != '_') {
          bool prev_lower = is_lower(name[i - 1]);
          bool prev_upper = is_upper(name[i - 1]);
          bool next_lower = (i + 1 < name.size()) && is_lower(name[i + 1]);

          if (prev_lower || (prev_upper && next_lower)) result += '_';
        }
        result += to_lower(c);
      } else {
        result += c;
      }
    }

    return result;
  }

  std::string
  capitalize(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    for (std::size_t i = 0; i < name.size(); ++i)
      result += i == 0 ? to_upper(name[i]) : to_lower(name[i]);
    return result;
  }

  std::string
  initial_case(std::string_view name) {
    std::string result(name);
    if (!result.empty()) result[0] = to_upper(result[0]);
    return result;
  }

  std::string
  camelize(std::string_view name) {
    std::string result;
    result.reserve(name.size());
    bool upper_next = true;
    for (char c : name) {
      if (c == '_' || c == '-' || c == '.') {
        upper_next = true;
        continue;
      }
      result += upper_next ? to_upper(c) : c;
      upper_next = false;
    }
    return result;
  }

  std::string
  escape_identifier(std::string_view name) {
    std::string result(name);
    if (cpp_keywords().count(result)) result += '_';
    return result;
  }

  std::string
  cpp_namespace_for(std::string_view thrift_namespace) {
    std::string result;
    for (char c : thrift_namespace) {
      if (c == '.')
        result += qualifier_separator;
      else
        result += c;
    }
    return result;
  }

  std::vector<std::string>
  split_qualified(std::string_view qualified_name) {
    std::vector<std::string> segments;
    while (true) {
      auto pos = qualified_name.find(qualifier_separator);
      if (pos == std::string_view::npos) break;
      if (pos > 0) segments.emplace_back(qualified_name.substr(0, pos));
      qualified_name.remove_prefix(pos + qualifier_separator.size());
    }
    if (!qualified_name.empty()) segments.emplace_back(qualified_name);
    return segments;
  }

  std::string
  join_qualified(const std::vector<std::string>& segments) {
    std::string result;
    for (const auto& segment : segments) {
      if (!result.empty()) result += qualifier_separator;
      result += segment;
    }
    return result;
  }

  std::string
  qualifier_of(std::string_view qualified_name) {
    auto pos = qualified_name.rfind(qualifier_separator);
    if (pos == std::string_view::npos) return {};
    return std::string(qualified_name.substr(0, pos));
  }

  std::string
  unqualified_name(std::string_view qualified_name) {
    auto pos = qualified_name.rfind(qualifier_separator);
    if (pos == std::string_view::npos) return std::string(qualified_name);
    return std::string(
        qualified_name.substr(pos + qualifier_separator.size()));
  }

  std::string
  test_data_module_name(std::string_view data_module_name) {
    auto segments = split_qualified(data_module_name);
    segments.insert(segments.end() - (segments.empty() ? 0 : 1), "test_data");
    return join_qualified(segments);
  }

  std::string
  target_path(std::string_view output_name) {
    std::string path;
    for (const auto& segment : split_qualified(output_name)) {
      if (!path.empty()) path += '/';
      path += to_snake_case(segment);
    }
    return path + ".hpp";
  }

} // namespace thriftgen
