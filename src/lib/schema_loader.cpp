#include <thriftgen/schema_loader.hpp>

#include <algorithm>
#include <charconv>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thriftgen {

  namespace {

    bool
    is_ws(char c) {
      return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    bool
    is_whitespace_only(std::string_view sv) {
      return !sv.empty() && std::all_of(sv.begin(), sv.end(), is_ws);
    }

    std::string_view
    trim(std::string_view sv) {
      while (!sv.empty() && is_ws(sv.front()))
        sv.remove_prefix(1);
      while (!sv.empty() && is_ws(sv.back()))
        sv.remove_suffix(1);
      return sv;
    }

    [[noreturn]] void
    fail(const xml_reader& reader, const std::string& message) {
      throw std::runtime_error("schema_loader: line " +
                               std::to_string(reader.line()) + ": " + message);
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    // Advances to the next child start element of the element at `depth`;
    // returns false once that element's end tag is reached.
    bool
    next_child(xml_reader& reader, std::size_t depth) {
      if (!read_skip_ws(reader)) fail(reader, "unexpected end of document");
      if (reader.node_type() == xml_node_type::end_element &&
          reader.depth() == depth)
        return false;
      if (reader.node_type() != xml_node_type::start_element)
        fail(reader, "unexpected text content");
      return true;
    }

    void
    expect_end(xml_reader& reader, std::size_t depth) {
      if (next_child(reader, depth)) {
        fail(reader, "unexpected element <" + reader.name() + ">");
      }
    }

    std::optional<std::string>
    opt_attr(const xml_reader& reader, std::string_view name) {
      const auto* value = reader.find_attribute(name);
      if (value == nullptr) return std::nullopt;
      return *value;
    }

    std::string
    req_attr(const xml_reader& reader, std::string_view name) {
      auto value = opt_attr(reader, name);
      if (!value) {
        fail(reader, "missing required attribute '" + std::string(name) +
                         "' on <" + reader.name() + ">");
      }
      return *value;
    }

    // Text content of a leaf element; leaves the reader on its end tag.
    std::string
    element_text(xml_reader& reader) {
      std::size_t depth = reader.depth();
      std::string text;
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters) {
          text += reader.text();
        } else if (reader.node_type() == xml_node_type::end_element &&
                   reader.depth() == depth) {
          return text;
        } else {
          fail(reader, "unexpected element <" + reader.name() +
                           "> in text content");
        }
      }
      fail(reader, "unexpected end of document");
    }

    template <typename T>
    T
    parse_number(const xml_reader& reader, std::string_view text) {
      text = trim(text);
      T value{};
      auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(),
                                       value);
      if (ec != std::errc() || end != text.data() + text.size()) {
        fail(reader, "invalid number '" + std::string(text) + "'");
      }
      return value;
    }

    bool
    parse_bool(const xml_reader& reader, std::string_view text) {
      text = trim(text);
      if (text == "true" || text == "1") return true;
      if (text == "false" || text == "0") return false;
      fail(reader, "invalid boolean '" + std::string(text) + "'");
    }

    // ===== types =====

    type_ref
    parse_type(xml_reader& reader);

    // Reads exactly one type element child and the parent's end tag.
    type_ref
    parse_single_type(xml_reader& reader) {
      std::size_t depth = reader.depth();
      if (!next_child(reader, depth))
        fail(reader, "expected a type element");
      auto t = parse_type(reader);
      expect_end(reader, depth);
      return t;
    }

    std::optional<base_type>
    base_type_named(std::string_view name) {
      if (name == "bool") return base_type::boolean;
      if (name == "byte" || name == "i8") return base_type::byte;
      if (name == "i16") return base_type::i16;
      if (name == "i32") return base_type::i32;
      if (name == "i64") return base_type::i64;
      if (name == "double") return base_type::double_;
      if (name == "string") return base_type::string;
      if (name == "binary") return base_type::binary;
      return std::nullopt;
    }

    type_ref
    parse_type(xml_reader& reader) {
      const std::string name = reader.name();
      std::size_t depth = reader.depth();

      if (auto base = base_type_named(name)) {
        expect_end(reader, depth);
        return type_ref::of(*base);
      }
      if (name == "ref") {
        auto t = type_ref::named(req_attr(reader, "name"));
        expect_end(reader, depth);
        return t;
      }
      if (name == "list") return type_ref::list_of(parse_single_type(reader));
      if (name == "set") return type_ref::set_of(parse_single_type(reader));
      if (name == "map") {
        if (!next_child(reader, depth)) fail(reader, "<map> needs a key type");
        auto key = parse_type(reader);
        if (!next_child(reader, depth))
          fail(reader, "<map> needs a value type");
        auto value = parse_type(reader);
        expect_end(reader, depth);
        return type_ref::map_of(std::move(key), std::move(value));
      }
      fail(reader, "unknown type element <" + name + ">");
    }

    // ===== literals =====

    literal
    parse_literal(xml_reader& reader);

    literal
    parse_single_literal(xml_reader& reader) {
      std::size_t depth = reader.depth();
      if (!next_child(reader, depth))
        fail(reader, "expected a literal element");
      auto l = parse_literal(reader);
      expect_end(reader, depth);
      return l;
    }

    literal
    parse_literal(xml_reader& reader) {
      const std::string name = reader.name();
      std::size_t depth = reader.depth();

      if (name == "bool")
        return literal::boolean(parse_bool(reader, element_text(reader)));
      if (name == "int") {
        return literal::integer(
            parse_number<std::int64_t>(reader, element_text(reader)));
      }
      if (name == "double") {
        auto text = element_text(reader);
        try {
          return literal::floating(std::stod(std::string(trim(text))));
        } catch (const std::exception&) {
          fail(reader, "invalid double '" + text + "'");
        }
      }
      if (name == "str") return literal::string(element_text(reader));
      if (name == "ident") {
        return literal::identifier(std::string(trim(element_text(reader))));
      }
      if (name == "list") {
        std::vector<literal> elements;
        while (next_child(reader, depth))
          elements.push_back(parse_literal(reader));
        return literal::list(std::move(elements));
      }
      if (name == "map") {
        std::vector<std::pair<literal, literal>> entries;
        while (next_child(reader, depth)) {
          if (reader.name() != "entry")
            fail(reader, "expected <entry> inside <map>");
          std::size_t entry_depth = reader.depth();
          std::optional<literal> key;
          std::optional<literal> value;
          while (next_child(reader, entry_depth)) {
            if (reader.name() == "key")
              key = parse_single_literal(reader);
            else if (reader.name() == "value")
              value = parse_single_literal(reader);
            else
              fail(reader, "unexpected <" + reader.name() + "> in <entry>");
          }
          if (!key || !value) fail(reader, "<entry> needs <key> and <value>");
          entries.emplace_back(std::move(*key), std::move(*value));
        }
        return literal::map(std::move(entries));
      }
      fail(reader, "unknown literal element <" + name + ">");
    }

    // ===== declarations =====

    requiredness
    parse_requiredness(const xml_reader& reader) {
      auto req = opt_attr(reader, "requiredness");
      if (!req || *req == "default") return requiredness::default_;
      if (*req == "required") return requiredness::required;
      if (*req == "optional") return requiredness::optional;
      fail(reader, "invalid requiredness '" + *req + "'");
    }

    field
    parse_field(xml_reader& reader) {
      field f;
      std::size_t depth = reader.depth();
      f.id = parse_number<std::int16_t>(reader, req_attr(reader, "id"));
      f.name = req_attr(reader, "name");
      f.req = parse_requiredness(reader);

      bool has_type = false;
      while (next_child(reader, depth)) {
        if (reader.name() == "type") {
          f.type = parse_single_type(reader);
          has_type = true;
        } else if (reader.name() == "default") {
          f.default_value = parse_single_literal(reader);
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <field>");
        }
      }
      if (!has_type) fail(reader, "field '" + f.name + "' has no <type>");
      return f;
    }

    std::vector<field>
    parse_fields(xml_reader& reader, std::string_view context) {
      std::vector<field> fields;
      std::size_t depth = reader.depth();
      while (next_child(reader, depth)) {
        if (reader.name() != "field")
          fail(reader, "expected <field> in <" + std::string(context) + ">");
        fields.push_back(parse_field(reader));
      }
      return fields;
    }

    struct_def
    parse_struct(xml_reader& reader, struct_kind kind) {
      struct_def s;
      s.kind = kind;
      s.name = req_attr(reader, "name");
      s.fields = parse_fields(reader, to_string(kind));
      return s;
    }

    enum_def
    parse_enum(xml_reader& reader) {
      enum_def e;
      std::size_t depth = reader.depth();
      e.name = req_attr(reader, "name");
      std::int32_t next_value = 0;
      while (next_child(reader, depth)) {
        if (reader.name() != "value") fail(reader, "expected <value> in <enum>");
        enumerator v;
        v.name = req_attr(reader, "name");
        auto explicit_value = opt_attr(reader, "value");
        v.value = explicit_value
                      ? parse_number<std::int32_t>(reader, *explicit_value)
                      : next_value;
        if (v.value == std::numeric_limits<std::int32_t>::max())
          next_value = v.value;
        else
          next_value = v.value + 1;
        expect_end(reader, reader.depth());
        e.values.push_back(std::move(v));
      }
      return e;
    }

    constant_def
    parse_constant(xml_reader& reader) {
      constant_def c;
      std::size_t depth = reader.depth();
      c.name = req_attr(reader, "name");
      bool has_type = false;
      bool has_value = false;
      while (next_child(reader, depth)) {
        if (reader.name() == "type") {
          c.type = parse_single_type(reader);
          has_type = true;
        } else if (reader.name() == "value") {
          c.value = parse_single_literal(reader);
          has_value = true;
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <const>");
        }
      }
      if (!has_type || !has_value)
        fail(reader, "const '" + c.name + "' needs <type> and <value>");
      return c;
    }

    typedef_def
    parse_typedef(xml_reader& reader) {
      typedef_def t;
      std::size_t depth = reader.depth();
      t.name = req_attr(reader, "name");
      if (!next_child(reader, depth) || reader.name() != "type")
        fail(reader, "typedef '" + t.name + "' has no <type>");
      t.target = parse_single_type(reader);
      expect_end(reader, depth);
      return t;
    }

    function_def
    parse_function(xml_reader& reader) {
      function_def fn;
      std::size_t depth = reader.depth();
      fn.name = req_attr(reader, "name");
      if (auto oneway = opt_attr(reader, "oneway"))
        fn.oneway = parse_bool(reader, *oneway);

      while (next_child(reader, depth)) {
        if (reader.name() == "returns") {
          fn.return_type = parse_single_type(reader);
        } else if (reader.name() == "field") {
          fn.params.push_back(parse_field(reader));
        } else if (reader.name() == "throws") {
          fn.exceptions = parse_fields(reader, "throws");
        } else {
          fail(reader, "unexpected <" + reader.name() + "> in <function>");
        }
      }
      return fn;
    }

    service_def
    parse_service(xml_reader& reader) {
      service_def svc;
      std::size_t depth = reader.depth();
      svc.name = req_attr(reader, "name");
      svc.extends = opt_attr(reader, "extends");
      while (next_child(reader, depth)) {
        if (reader.name() != "function")
          fail(reader, "expected <function> in <service>");
        svc.functions.push_back(parse_function(reader));
      }
      return svc;
    }

    schema
    parse_schema(xml_reader& reader) {
      schema s(req_attr(reader, "module"));
      std::size_t depth = reader.depth();
      if (auto path = opt_attr(reader, "path")) s.set_path(*path);

      while (next_child(reader, depth)) {
        const std::string& name = reader.name();
        if (name == "namespace") {
          s.set_namespace(req_attr(reader, "language"),
                          req_attr(reader, "value"));
          expect_end(reader, reader.depth());
        } else if (name == "include") {
          s.add_include(req_attr(reader, "module"));
          expect_end(reader, reader.depth());
        } else if (name == "typedef") {
          s.add_typedef(parse_typedef(reader));
        } else if (name == "enum") {
          s.add_enum(parse_enum(reader));
        } else if (name == "const") {
          s.add_constant(parse_constant(reader));
        } else if (name == "struct") {
          s.add_struct(parse_struct(reader, struct_kind::struct_));
        } else if (name == "union") {
          s.add_struct(parse_struct(reader, struct_kind::union_));
        } else if (name == "exception") {
          s.add_struct(parse_struct(reader, struct_kind::exception));
        } else if (name == "service") {
          s.add_service(parse_service(reader));
        } else {
          fail(reader, "unexpected <" + name + "> in <schema>");
        }
      }
      return s;
    }

  } // namespace

  file_group
  schema_loader::load(xml_reader& reader) {
    if (!read_skip_ws(reader) ||
        reader.node_type() != xml_node_type::start_element ||
        reader.name() != "file-group") {
      throw std::runtime_error(
          "schema_loader: expected <file-group> root element");
    }

    file_group group;
    if (auto initial = opt_attr(reader, "initial"))
      group.set_initial_module(*initial);

    std::size_t depth = reader.depth();
    while (next_child(reader, depth)) {
      if (reader.name() != "schema")
        fail(reader, "expected <schema> in <file-group>");
      group.add(parse_schema(reader));
    }

    if (group.schemas().empty())
      throw std::runtime_error("schema_loader: <file-group> has no schemas");
    if (group.find_schema(group.initial_module()) == nullptr) {
      throw std::runtime_error("schema_loader: initial module '" +
                               group.initial_module() + "' is not present");
    }
    return group;
  }

} // namespace thriftgen
