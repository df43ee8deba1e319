#include "descriptors.h"

#include "cross_version.h"
#include "digest.h"
#include "trace.h"
#include "util.h"
#include "xml_util.h"

#include <stdexcept>

namespace dbuild {

namespace {

artifact_location const *find_available(std::vector<artifact_location> const &available,
                                        std::string const &organization,
                                        std::string const &name) {
  auto const fixed{ fix_name(name) };
  for (auto const &a : available) {
    if (a.module.organization == organization && a.module.name == fixed) { return &a; }
  }
  return nullptr;
}

std::string final_name(artifact_location const &a) {
  return a.module.name + a.cross_suffix;
}

void finish_rewrite(xmlDoc *doc,
                    std::filesystem::path const &file,
                    char const *kind,
                    bool changed) {
  if (changed) {
    xml_save(doc, file);
    refresh_checksum_files(file);
  }
  DBUILD_TRACE_DESCRIPTOR_REWRITTEN(file.generic_string(), kind, changed);
}

}  // namespace

bool pom_rewrite(std::filesystem::path const &file,
                 std::string_view artifact_id,
                 std::vector<artifact_location> const &available) {
  auto const doc{ xml_load(file) };
  xmlNode *project{ xmlDocGetRootElement(doc.get()) };
  if (!xml_is_element(project, "project")) {
    throw std::runtime_error(file.string() + " is not a POM");
  }

  bool changed{ xml_set_child_text(project, "artifactId", artifact_id) };

  for (xmlNode *dep : xml_children(xml_child(project, "dependencies"), "dependency")) {
    xmlNode *group{ xml_child(dep, "groupId") };
    xmlNode *artifact{ xml_child(dep, "artifactId") };
    if (!group || !artifact) { continue; }

    auto const *target{ find_available(available, xml_text(group), xml_text(artifact)) };
    if (!target) { continue; }

    changed |= xml_set_text(artifact, final_name(*target));
    changed |= xml_set_child_text(dep, "version", target->version);
  }

  finish_rewrite(doc.get(), file, "pom", changed);
  return changed;
}

bool ivy_rewrite(std::filesystem::path const &file,
                 std::string_view module_name,
                 std::vector<artifact_location> const &available) {
  auto const doc{ xml_load(file) };
  xmlNode *root{ xmlDocGetRootElement(doc.get()) };
  xmlNode *info{ xml_child(root, "info") };
  if (!xml_is_element(root, "ivy-module") || !info) {
    throw std::runtime_error(file.string() + " is not an ivy module descriptor");
  }

  auto const own_org{ xml_attr(info, "organisation").value_or("") };
  bool changed{ xml_set_attr(info, "module", module_name) };

  auto const own_fixed{ fix_name(module_name) };
  for (xmlNode *art : xml_children(xml_child(root, "publications"), "artifact")) {
    auto const name{ xml_attr(art, "name") };
    if (name && fix_name(*name) == own_fixed) {
      changed |= xml_set_attr(art, "name", module_name);
    }
  }

  for (xmlNode *dep : xml_children(xml_child(root, "dependencies"), "dependency")) {
    auto const name{ xml_attr(dep, "name") };
    if (!name) { continue; }
    auto const org{ xml_attr(dep, "org").value_or(own_org) };

    auto const *target{ find_available(available, org, *name) };
    if (!target) { continue; }

    changed |= xml_set_attr(dep, "name", final_name(*target));
    changed |= xml_set_attr(dep, "rev", target->version);
    if (xml_attr(dep, "revConstraint")) {
      changed |= xml_set_attr(dep, "revConstraint", target->version);
    }

    for (xmlNode *dep_art : xml_children(dep, "artifact")) {
      auto const art_name{ xml_attr(dep_art, "name") };
      if (art_name && fix_name(*art_name) == target->module.name) {
        changed |= xml_set_attr(dep_art, "name", final_name(*target));
      }
    }
  }

  finish_rewrite(doc.get(), file, "ivy", changed);
  return changed;
}

void refresh_checksum_files(std::filesystem::path const &file) {
  for (auto const algorithm : { checksum_algorithm::md5, checksum_algorithm::sha1 }) {
    auto sidecar{ file };
    sidecar += "." + std::string{ checksum_extension(algorithm) };
    if (std::filesystem::exists(sidecar)) {
      util_write_file(sidecar, checksum_file_hex(algorithm, file));
    }
  }
}

}  // namespace dbuild
