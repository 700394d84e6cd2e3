#include "kintree/xml/document.hpp"

#include "kintree/core/common/logger.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <limits>
#include <memory>
#include <sstream>

namespace kintree::xml {
namespace {

using kintree::core::LogLevel;
using kintree::core::LogLine;
using kintree::core::log;

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
  void operator()(xmlChar* s) const { xmlFree(s); }
};

using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

std::string toString(const xmlChar* s) {
  return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

std::string lastXmlError() {
  const xmlError* err = xmlGetLastError();
  if (!err || !err->message) return "unknown libxml2 error";

  std::string msg(err->message);
  while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) msg.pop_back();

  std::ostringstream oss;
  oss << msg;
  if (err->line > 0) oss << " (line " << err->line << ")";
  return oss.str();
}

void convertElement(xmlDoc* doc, const xmlNode* node, Element* out) {
  out->tag = toString(node->name);
  out->line = static_cast<int>(xmlGetLineNo(node));

  for (const xmlAttr* a = node->properties; a != nullptr; a = a->next) {
    XmlCharPtr value(xmlNodeListGetString(doc, a->children, 1));
    out->attributes[toString(a->name)] = AttributeValue(toString(value.get()));
  }

  for (const xmlNode* c = node->children; c != nullptr; c = c->next) {
    if (c->type != XML_ELEMENT_NODE) continue;
    out->children.emplace_back();
    convertElement(doc, c, &out->children.back());
  }
}

}  // namespace

const AttributeValue* Element::attribute(const std::string& name) const {
  const auto it = attributes.find(name);
  return it == attributes.end() ? nullptr : &it->second;
}

std::vector<const Element*> Element::childrenWithTag(const std::string& child_tag) const {
  std::vector<const Element*> out;
  for (const auto& c : children) {
    if (c.tag == child_tag) out.push_back(&c);
  }
  return out;
}

std::vector<Element*> Element::childrenWithTag(const std::string& child_tag) {
  std::vector<Element*> out;
  for (auto& c : children) {
    if (c.tag == child_tag) out.push_back(&c);
  }
  return out;
}

std::string describe(const Element& e) {
  std::ostringstream oss;
  oss << "<" << e.tag << ">";
  if (e.line > 0) oss << " (line " << e.line << ")";
  return oss.str();
}

Status parseDocument(const std::string& text, Element* root, std::string* message) {
  if (!root || !message) {
    log(LogLevel::Error, "parseDocument: null output");
    return Status::InvalidParameter;
  }
  if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    *message = "document too large";
    return Status::ParseError;
  }

  xmlResetLastError();
  XmlDocPtr doc(xmlReadMemory(text.data(), static_cast<int>(text.size()), "model.xml", nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
  if (!doc) {
    *message = "malformed XML: " + lastXmlError();
    return Status::ParseError;
  }

  const xmlNode* top = xmlDocGetRootElement(doc.get());
  if (!top) {
    *message = "malformed XML: document has no root element";
    return Status::ParseError;
  }

  *root = Element{};
  convertElement(doc.get(), top, root);
  LogLine(LogLevel::Debug) << "parsed document with root " << describe(*root);
  return Status::Success;
}

}  // namespace kintree::xml
