#pragma once

#include "util.h"

#include <libxml/tree.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dbuild {

// RAII wrapper for libxml2 global initialization/cleanup.
struct libxml2_scope : unmovable {
  libxml2_scope();
  ~libxml2_scope();
};

struct xml_doc_deleter {
  void operator()(xmlDoc *doc) const noexcept;
};
using xml_doc_ptr = std::unique_ptr<xmlDoc, xml_doc_deleter>;

// Throws std::runtime_error naming the file on parse failure
xml_doc_ptr xml_load(std::filesystem::path const &path);
// Re-serializes the whole document: comments and formatting survive, but the XML
// declaration is normalized (a missing one is added). Save only documents that changed.
void xml_save(xmlDoc *doc, std::filesystem::path const &path);

bool xml_is_element(xmlNode const *node, char const *name);

// Element children by local name, ignoring namespaces
xmlNode *xml_child(xmlNode *parent, char const *name);
std::vector<xmlNode *> xml_children(xmlNode *parent, char const *name);

// Text content with surrounding whitespace removed
std::string xml_text(xmlNode const *node);
std::optional<std::string> xml_attr(xmlNode const *node, char const *name);

// Setters return whether the document changed
bool xml_set_text(xmlNode *node, std::string_view value);
bool xml_set_attr(xmlNode *node, char const *name, std::string_view value);
bool xml_set_child_text(xmlNode *parent, char const *name, std::string_view value);

}  // namespace dbuild
