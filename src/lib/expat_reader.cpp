#include <thriftgen/expat_reader.hpp>

#include <expat.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace thriftgen {

  namespace {

    struct attribute {
      std::string name;
      std::string value;
    };

    struct event {
      xml_node_type type;
      std::string name;
      std::string text;
      std::vector<attribute> attributes;
      std::size_t depth = 0;
      std::size_t line = 0;
    };

  } // namespace

  struct expat_reader::impl {
    XML_Parser parser = nullptr;
    std::vector<event> events;
    std::size_t cursor = 0;
    std::size_t current_depth = 0;

    std::size_t
    current_line() const {
      return static_cast<std::size_t>(XML_GetCurrentLineNumber(parser));
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      auto* self = static_cast<impl*>(user_data);
      self->current_depth++;

      event ev;
      ev.type = xml_node_type::start_element;
      ev.name = name;
      ev.depth = self->current_depth;
      ev.line = self->current_line();

      for (const char** p = atts; *p != nullptr; p += 2)
        ev.attributes.push_back({std::string(p[0]), std::string(p[1])});

      self->events.push_back(std::move(ev));
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      auto* self = static_cast<impl*>(user_data);

      event ev;
      ev.type = xml_node_type::end_element;
      ev.name = name;
      ev.depth = self->current_depth;
      ev.line = self->current_line();

      self->events.push_back(std::move(ev));
      self->current_depth--;
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      auto* self = static_cast<impl*>(user_data);

      // Coalesce adjacent character data into a single event
      if (!self->events.empty() &&
          self->events.back().type == xml_node_type::characters) {
        self->events.back().text.append(s, static_cast<std::size_t>(len));
        return;
      }

      event ev;
      ev.type = xml_node_type::characters;
      ev.text.assign(s, static_cast<std::size_t>(len));
      ev.depth = self->current_depth;
      ev.line = self->current_line();
      self->events.push_back(std::move(ev));
    }
  };

  expat_reader::expat_reader(std::string_view xml)
      : impl_(std::make_unique<impl>()) {
    XML_Parser parser = XML_ParserCreate(nullptr);
    if (parser == nullptr) {
      throw std::runtime_error("failed to create expat parser");
    }
    impl_->parser = parser;

    XML_SetUserData(parser, impl_.get());
    XML_SetElementHandler(parser, impl::on_start_element, impl::on_end_element);
    XML_SetCharacterDataHandler(parser, impl::on_character_data);

    XML_Status status =
        XML_Parse(parser, xml.data(), static_cast<int>(xml.size()), XML_TRUE);

    if (status == XML_STATUS_ERROR) {
      std::string msg = "XML parse error at line ";
      msg += std::to_string(XML_GetCurrentLineNumber(parser));
      msg += ": ";
      msg += XML_ErrorString(XML_GetErrorCode(parser));
      XML_ParserFree(parser);
      impl_->parser = nullptr;
      throw std::runtime_error(msg);
    }

    XML_ParserFree(parser);
    impl_->parser = nullptr;

    if (impl_->events.empty()) {
      throw std::runtime_error("XML parse error: no content");
    }
  }

  expat_reader::~expat_reader() = default;
  expat_reader::expat_reader(expat_reader&&) noexcept = default;
  expat_reader&
  expat_reader::operator=(expat_reader&&) noexcept = default;

  bool
  expat_reader::read() {
    if (impl_->cursor >= impl_->events.size()) return false;
    impl_->cursor++;
    return true;
  }

  xml_node_type
  expat_reader::node_type() const {
    return impl_->events[impl_->cursor - 1].type;
  }

  const std::string&
  expat_reader::name() const {
    return impl_->events[impl_->cursor - 1].name;
  }

  std::size_t
  expat_reader::attribute_count() const {
    return impl_->events[impl_->cursor - 1].attributes.size();
  }

  const std::string&
  expat_reader::attribute_name(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].name;
  }

  std::string_view
  expat_reader::attribute_value(std::size_t index) const {
    return impl_->events[impl_->cursor - 1].attributes[index].value;
  }

  const std::string*
  expat_reader::find_attribute(std::string_view attr_name) const {
    for (const auto& attr : impl_->events[impl_->cursor - 1].attributes) {
      if (attr.name == attr_name) return &attr.value;
    }
    return nullptr;
  }

  std::string_view
  expat_reader::text() const {
    return impl_->events[impl_->cursor - 1].text;
  }

  std::size_t
  expat_reader::depth() const {
    return impl_->events[impl_->cursor - 1].depth;
  }

  std::size_t
  expat_reader::line() const {
    return impl_->events[impl_->cursor - 1].line;
  }

} // namespace thriftgen
