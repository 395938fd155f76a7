#include "bluos/xml_reader.h"

#include "bluos/errors.h"
#include "string_util.h"

#include <cctype>
#include <cstdlib>

namespace bluos
{

namespace
{

bool is_name_start(char c)
{
  unsigned char u = static_cast<unsigned char>(c);
  return std::isalpha(u) || c == '_' || c == ':' || u >= 0x80;
}

bool is_name_char(char c)
{
  unsigned char u = static_cast<unsigned char>(c);
  return is_name_start(c) || std::isdigit(u) || c == '-' || c == '.';
}

void append_utf8(std::string &out, unsigned long cp)
{
  if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    throw ProtocolError("invalid character reference");

  if (cp < 0x80)
  {
    out += static_cast<char>(cp);
  }
  else if (cp < 0x800)
  {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else if (cp < 0x10000)
  {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  else
  {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// Expands the five predefined entities and numeric references.
std::string decode_entities(const std::string &raw)
{
  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); i++)
  {
    if (raw[i] != '&')
    {
      out += raw[i];
      continue;
    }

    size_t semi = raw.find(';', i);
    if (semi == std::string::npos || semi - i > 12)
      throw ProtocolError("unterminated entity reference");

    std::string entity = raw.substr(i + 1, semi - i - 1);
    if (entity == "lt")
      out += '<';
    else if (entity == "gt")
      out += '>';
    else if (entity == "amp")
      out += '&';
    else if (entity == "quot")
      out += '"';
    else if (entity == "apos")
      out += '\'';
    else if (entity.size() > 1 && entity[0] == '#')
    {
      bool hex = entity[1] == 'x' || entity[1] == 'X';
      std::string digits = entity.substr(hex ? 2 : 1);
      char *end = nullptr;
      unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
      if (digits.empty() || *end != '\0')
        throw ProtocolError("malformed character reference &" + entity + ";");
      append_utf8(out, cp);
    }
    else
    {
      throw ProtocolError("undeclared entity &" + entity + ";");
    }
    i = semi;
  }
  return out;
}

class Parser
{
public:
  Parser(const std::string &doc, XmlHandler &handler)
      : doc_(doc), handler_(handler), pos_(0), elements_(0), root_closed_(false) {}

  void run()
  {
    if (doc_.size() > MAX_XML_SIZE)
      throw ProtocolError("document exceeds " + std::to_string(MAX_XML_SIZE) + " bytes");
    if (doc_.compare(0, 3, "\xEF\xBB\xBF") == 0)
      pos_ = 3;

    while (pos_ < doc_.size())
    {
      if (doc_[pos_] == '<')
        markup();
      else
        character_data();
    }

    if (!stack_.empty())
      throw ProtocolError("unclosed element <" + stack_.back() + ">");
    if (elements_ == 0)
      throw ProtocolError("document has no root element");
  }

private:
  bool at(const char *s) const { return doc_.compare(pos_, std::char_traits<char>::length(s), s) == 0; }

  size_t find_or_throw(const char *terminator, const char *what) const
  {
    size_t end = doc_.find(terminator, pos_);
    if (end == std::string::npos)
      throw ProtocolError(std::string("unterminated ") + what);
    return end;
  }

  void markup()
  {
    if (at("<?"))
    {
      pos_ = find_or_throw("?>", "processing instruction") + 2;
    }
    else if (at("<!--"))
    {
      pos_ = find_or_throw("-->", "comment") + 3;
    }
    else if (at("<![CDATA["))
    {
      if (stack_.empty())
        throw ProtocolError("CDATA outside the root element");
      size_t start = pos_ + 9;
      pos_ = start;
      size_t end = find_or_throw("]]>", "CDATA section");
      emit_text(doc_.substr(start, end - start));
      pos_ = end + 3;
    }
    else if (at("<!DOCTYPE") || at("<!ENTITY"))
    {
      throw ProtocolError("document type and entity declarations are not accepted");
    }
    else if (at("<!"))
    {
      throw ProtocolError("unsupported markup declaration");
    }
    else if (at("</"))
    {
      end_tag();
    }
    else
    {
      start_tag();
    }
  }

  std::string name()
  {
    size_t start = pos_;
    if (pos_ >= doc_.size() || !is_name_start(doc_[pos_]))
      throw ProtocolError("malformed element or attribute name");
    while (pos_ < doc_.size() && is_name_char(doc_[pos_]))
      pos_++;
    return doc_.substr(start, pos_ - start);
  }

  void skip_space()
  {
    while (pos_ < doc_.size() && std::isspace(static_cast<unsigned char>(doc_[pos_])))
      pos_++;
  }

  void start_tag()
  {
    if (root_closed_)
      throw ProtocolError("content after the root element");

    pos_++; // '<'
    std::string tag = name();
    XmlAttributes attributes;

    while (true)
    {
      skip_space();
      if (pos_ >= doc_.size())
        throw ProtocolError("unterminated start tag <" + tag + ">");

      if (doc_[pos_] == '>' || at("/>"))
        break;

      std::string attr = name();
      skip_space();
      if (pos_ >= doc_.size() || doc_[pos_] != '=')
        throw ProtocolError("attribute " + attr + " has no value");
      pos_++;
      skip_space();
      if (pos_ >= doc_.size() || (doc_[pos_] != '"' && doc_[pos_] != '\''))
        throw ProtocolError("attribute " + attr + " value is not quoted");
      char quote = doc_[pos_++];
      size_t end = doc_.find(quote, pos_);
      if (end == std::string::npos)
        throw ProtocolError("unterminated attribute value");
      std::string raw = doc_.substr(pos_, end - pos_);
      if (raw.find('<') != std::string::npos)
        throw ProtocolError("'<' in attribute value");
      pos_ = end + 1;

      if (attributes.count(attr))
        throw ProtocolError("duplicate attribute " + attr);
      if (attributes.size() >= MAX_XML_ATTRIBUTES)
        throw ProtocolError("element <" + tag + "> has more than " + std::to_string(MAX_XML_ATTRIBUTES) +
                            " attributes");
      attributes[attr] = decode_entities(raw);
    }

    bool self_closing = at("/>");
    pos_ += self_closing ? 2 : 1;

    if (++elements_ > MAX_XML_ELEMENTS)
      throw ProtocolError("document has more than " + std::to_string(MAX_XML_ELEMENTS) + " elements");
    if (stack_.size() + 1 > MAX_XML_DEPTH)
      throw ProtocolError("document nests deeper than " + std::to_string(MAX_XML_DEPTH) + " levels");

    handler_.start_element(tag, attributes);
    if (self_closing)
    {
      handler_.end_element(tag);
      if (stack_.empty())
        root_closed_ = true;
    }
    else
    {
      stack_.push_back(tag);
      text_sizes_.push_back(0);
    }
  }

  void end_tag()
  {
    pos_ += 2; // "</"
    std::string tag = name();
    skip_space();
    if (pos_ >= doc_.size() || doc_[pos_] != '>')
      throw ProtocolError("malformed end tag </" + tag + ">");
    pos_++;

    if (stack_.empty() || stack_.back() != tag)
      throw ProtocolError("mismatched end tag </" + tag + ">");
    stack_.pop_back();
    text_sizes_.pop_back();
    handler_.end_element(tag);
    if (stack_.empty())
      root_closed_ = true;
  }

  void character_data()
  {
    size_t end = doc_.find('<', pos_);
    if (end == std::string::npos)
      end = doc_.size();
    std::string raw = doc_.substr(pos_, end - pos_);
    pos_ = end;

    if (stack_.empty())
    {
      if (!trim(raw).empty())
        throw ProtocolError("text outside the root element");
      return;
    }
    emit_text(decode_entities(raw));
  }

  void emit_text(const std::string &text)
  {
    text_sizes_.back() += text.size();
    if (text_sizes_.back() > MAX_XML_TEXT)
      throw ProtocolError("element text exceeds " + std::to_string(MAX_XML_TEXT) + " bytes");
    if (!text.empty())
      handler_.text(text);
  }

  const std::string &doc_;
  XmlHandler &handler_;
  size_t pos_;
  size_t elements_;
  bool root_closed_;
  std::vector<std::string> stack_;
  std::vector<size_t> text_sizes_; // per open element
};

class TreeBuilder : public XmlHandler
{
public:
  void start_element(const std::string &name, const XmlAttributes &attributes) override
  {
    XmlElement element;
    element.name = name;
    element.attributes = attributes;
    open_.push_back(std::move(element));
  }

  void end_element(const std::string &) override
  {
    XmlElement element = std::move(open_.back());
    open_.pop_back();
    if (open_.empty())
      root_ = std::move(element);
    else
      open_.back().children.push_back(std::move(element));
  }

  void text(const std::string &text) override
  {
    if (!open_.empty())
      open_.back().text += text;
  }

  XmlElement &root() { return root_; }

private:
  std::vector<XmlElement> open_;
  XmlElement root_;
};

} // namespace

void XmlReader::parse(const std::string &document)
{
  Parser parser(document, handler_);
  parser.run();
}

const XmlElement *XmlElement::child(const std::string &child_name) const
{
  for (const auto &c : children)
  {
    if (c.name == child_name)
      return &c;
  }
  return nullptr;
}

std::vector<const XmlElement *> XmlElement::children_named(const std::string &child_name) const
{
  std::vector<const XmlElement *> result;
  for (const auto &c : children)
  {
    if (c.name == child_name)
      result.push_back(&c);
  }
  return result;
}

std::string XmlElement::child_text(const std::string &child_name) const
{
  const XmlElement *c = child(child_name);
  return c ? trim(c->text) : std::string();
}

std::string XmlElement::attribute(const std::string &attr_name) const
{
  auto it = attributes.find(attr_name);
  return it == attributes.end() ? std::string() : it->second;
}

bool XmlElement::has_attribute(const std::string &attr_name) const
{
  return attributes.find(attr_name) != attributes.end();
}

XmlElement parse_xml_document(const std::string &document)
{
  TreeBuilder builder;
  XmlReader reader(builder);
  reader.parse(document);
  return std::move(builder.root());
}

} // namespace bluos
