#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace bluos
{

static const size_t MAX_XML_SIZE = 1024 * 1024;
static const size_t MAX_XML_DEPTH = 20;
static const size_t MAX_XML_ELEMENTS = 10000;
static const size_t MAX_XML_ATTRIBUTES = 100;
static const size_t MAX_XML_TEXT = 100 * 1024;

typedef std::map<std::string, std::string> XmlAttributes;

// Event callbacks for XmlReader. Text arrives entity-decoded and may be
// split across several calls.
class XmlHandler
{
public:
  virtual ~XmlHandler() = default;

  virtual void start_element(const std::string &name, const XmlAttributes &attributes) = 0;
  virtual void end_element(const std::string &name) = 0;
  virtual void text(const std::string &text) = 0;
};

// Bounded, non-validating reader for the small documents devices return.
// Document type declarations, entity declarations and undeclared entities
// are rejected; so is anything over the size, depth, element, attribute or
// text ceilings. Every rejection is a ProtocolError.
class XmlReader
{
public:
  explicit XmlReader(XmlHandler &handler) : handler_(handler) {}

  void parse(const std::string &document);

private:
  XmlHandler &handler_;
};

struct XmlElement
{
  std::string name;
  XmlAttributes attributes;
  std::string text;
  std::vector<XmlElement> children;

  const XmlElement *child(const std::string &child_name) const;
  std::vector<const XmlElement *> children_named(const std::string &child_name) const;

  // Trimmed text of the first child with that name, or empty.
  std::string child_text(const std::string &child_name) const;
  std::string attribute(const std::string &attr_name) const;
  bool has_attribute(const std::string &attr_name) const;
};

// Builds a tree with XmlReader; throws ProtocolError like the reader does.
XmlElement parse_xml_document(const std::string &document);

} // namespace bluos
