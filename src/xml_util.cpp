#include "xml_util.h"

#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlmemory.h>

#include <stdexcept>

namespace dbuild {

namespace {

std::string trim(std::string_view text) {
  auto const first{ text.find_first_not_of(" \t\r\n") };
  if (first == std::string_view::npos) { return {}; }
  auto const last{ text.find_last_not_of(" \t\r\n") };
  return std::string{ text.substr(first, last - first + 1) };
}

std::string last_xml_error() {
  if (xmlError const *err{ xmlGetLastError() }; err && err->message) {
    return trim(err->message);
  }
  return "unknown error";
}

xmlChar const *xml_str(char const *s) { return reinterpret_cast<xmlChar const *>(s); }

}  // namespace

libxml2_scope::libxml2_scope() { xmlInitParser(); }
libxml2_scope::~libxml2_scope() { xmlCleanupParser(); }

void xml_doc_deleter::operator()(xmlDoc *doc) const noexcept {
  if (doc) { xmlFreeDoc(doc); }
}

xml_doc_ptr xml_load(std::filesystem::path const &path) {
  xmlResetLastError();
  xml_doc_ptr doc{ xmlReadFile(path.string().c_str(),
                               nullptr,
                               XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING) };
  if (!doc) {
    throw std::runtime_error("Failed to parse " + path.string() + ": " + last_xml_error());
  }
  return doc;
}

void xml_save(xmlDoc *doc, std::filesystem::path const &path) {
  if (xmlSaveFormatFileEnc(path.string().c_str(), doc, "UTF-8", 0) < 0) {
    throw std::runtime_error("Failed to write " + path.string() + ": " + last_xml_error());
  }
}

bool xml_is_element(xmlNode const *node, char const *name) {
  return node && node->type == XML_ELEMENT_NODE && xmlStrEqual(node->name, xml_str(name));
}

xmlNode *xml_child(xmlNode *parent, char const *name) {
  for (xmlNode *child{ parent ? parent->children : nullptr }; child; child = child->next) {
    if (xml_is_element(child, name)) { return child; }
  }
  return nullptr;
}

std::vector<xmlNode *> xml_children(xmlNode *parent, char const *name) {
  std::vector<xmlNode *> out;
  for (xmlNode *child{ parent ? parent->children : nullptr }; child; child = child->next) {
    if (xml_is_element(child, name)) { out.push_back(child); }
  }
  return out;
}

std::string xml_text(xmlNode const *node) {
  xmlChar *content{ xmlNodeGetContent(node) };
  if (!content) { return {}; }
  std::string out{ trim(reinterpret_cast<char const *>(content)) };
  xmlFree(content);
  return out;
}

std::optional<std::string> xml_attr(xmlNode const *node, char const *name) {
  xmlChar *value{ xmlGetProp(node, xml_str(name)) };
  if (!value) { return std::nullopt; }
  std::string out{ reinterpret_cast<char const *>(value) };
  xmlFree(value);
  return out;
}

bool xml_set_text(xmlNode *node, std::string_view value) {
  if (xml_text(node) == value) { return false; }
  std::string const text{ value };
  xmlNodeSetContent(node, nullptr);
  xmlNodeAddContent(node, xml_str(text.c_str()));
  return true;
}

bool xml_set_attr(xmlNode *node, char const *name, std::string_view value) {
  if (xml_attr(node, name) == value) { return false; }
  std::string const text{ value };
  if (!xmlSetProp(node, xml_str(name), xml_str(text.c_str()))) {
    throw std::runtime_error("Failed to set XML attribute " + std::string{ name });
  }
  return true;
}

bool xml_set_child_text(xmlNode *parent, char const *name, std::string_view value) {
  if (xmlNode *child{ xml_child(parent, name) }) { return xml_set_text(child, value); }
  std::string const text{ value };
  if (!xmlNewTextChild(parent, parent->ns, xml_str(name), xml_str(text.c_str()))) {
    throw std::runtime_error("Failed to add XML element " + std::string{ name });
  }
  return true;
}

}  // namespace dbuild
