#include "artifact_repository.h"

#include "digest.h"
#include "platform.h"
#include "trace.h"
#include "tui.h"

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace dbuild {

namespace {

constexpr char const *kIndexHeader{ "dbuild-artifacts 1" };
constexpr char const *kIndexFile{ "artifacts" };
constexpr char const *kCompleteMarker{ "dbuild-complete" };

void check_field(std::string const &value) {
  if (value.find_first_of("\t\n\r") != std::string::npos) {
    throw std::runtime_error("Artifact index field contains a control character: " +
                             value);
  }
}

std::string join_fields(std::vector<std::string> const &fields) {
  std::string line;
  for (std::size_t i{ 0 }; i < fields.size(); ++i) {
    check_field(fields[i]);
    if (i) { line += '\t'; }
    line += fields[i];
  }
  line += '\n';
  return line;
}

// Moves `from` to `to` unless `to` already exists (another writer got there first).
void install_path(std::filesystem::path const &from, std::filesystem::path const &to) {
  if (platform::file_exists(to)) {
    std::error_code ec;
    std::filesystem::remove_all(from, ec);
    return;
  }
  platform::atomic_rename(from, to);
}

}  // namespace

std::string artifact_index_write(build_artifacts_out const &artifacts) {
  std::string out{ kIndexHeader };
  out += '\n';
  for (auto const &sub : artifacts.results) {
    out += join_fields({ "subproject", sub.subproject });
    for (auto const &a : sub.artifacts) {
      out += join_fields({ "artifact",
                           a.module.organization,
                           a.module.name,
                           a.artifact.extension,
                           a.artifact.classifier,
                           a.cross_suffix,
                           a.version,
                           a.path });
    }
    for (auto const &s : sub.shas) { out += join_fields({ "sha", s.sha, s.location }); }
  }
  return out;
}

build_artifacts_out artifact_index_read(std::string const &text) {
  std::istringstream in{ text };
  std::string line;

  if (!std::getline(in, line) || line != kIndexHeader) {
    throw std::runtime_error("Artifact index: bad header");
  }

  build_artifacts_out out;
  while (std::getline(in, line)) {
    if (line.empty()) { continue; }
    auto const fields{ util_split(line, '\t') };
    auto const &tag{ fields[0] };

    if (tag == "subproject" && fields.size() == 2) {
      out.results.push_back({ .subproject = fields[1] });
      continue;
    }

    if (out.results.empty()) {
      throw std::runtime_error("Artifact index: entry before subproject: " + line);
    }
    auto &sub{ out.results.back() };

    if (tag == "artifact" && fields.size() == 8) {
      sub.artifacts.push_back({ .module = { fields[1], fields[2] },
                                .artifact = { fields[3], fields[4] },
                                .cross_suffix = fields[5],
                                .path = fields[7],
                                .version = fields[6] });
    } else if (tag == "sha" && fields.size() == 3) {
      sub.shas.push_back({ .sha = fields[1], .location = fields[2] });
    } else {
      throw std::runtime_error("Artifact index: malformed line: " + line);
    }
  }
  return out;
}

artifact_repository::artifact_repository(path root) : root_{ std::move(root) } {
  std::filesystem::create_directories(raw_dir());
  std::filesystem::create_directories(meta_dir());
}

artifact_repository::path artifact_repository::tmp_path(std::string const &tag) const {
  static std::atomic<unsigned> counter{ 0 };
  return root_ / (".tmp-" + tag + "-" + std::to_string(::getpid()) + "-" +
                  std::to_string(counter.fetch_add(1)));
}

artifact_sha artifact_repository::make_artifact_sha(path const &file,
                                                    path const &repo_root) {
  return { .sha = sha256_file_hex(file),
           .location = util_relative_generic(file, repo_root) };
}

void artifact_repository::publish(std::string const &uuid,
                                  path const &local_repo,
                                  build_artifacts_out const &artifacts) const {
  auto const entry{ meta_dir() / uuid };
  if (platform::file_exists(entry / kCompleteMarker)) { return; }

  std::int64_t files{ 0 };
  for (auto const &sub : artifacts.results) {
    for (auto const &s : sub.shas) {
      auto const blob{ raw_dir() / s.sha };
      ++files;
      if (platform::file_exists(blob)) { continue; }

      auto const source{ local_repo / s.location };
      auto const tmp{ tmp_path(s.sha) };
      scoped_path_cleanup tmp_cleanup{ tmp };
      std::filesystem::copy_file(source, tmp);

      if (sha256_file_hex(tmp) != s.sha) {
        throw std::runtime_error("Content of " + source.string() +
                                 " changed after its sha was computed");
      }
      install_path(tmp, blob);
    }
  }

  auto const tmp_entry{ tmp_path(uuid) };
  scoped_path_cleanup entry_cleanup{ tmp_entry };
  util_write_file(tmp_entry / kIndexFile, artifact_index_write(artifacts));
  platform::touch_file(tmp_entry / kCompleteMarker);
  install_path(tmp_entry, entry);

  DBUILD_TRACE_REPOSITORY_PUBLISH(uuid, files);
  tui::debug("Published %s (%lld files)", uuid.c_str(), static_cast<long long>(files));
}

std::optional<build_artifacts_out> artifact_repository::lookup(
    std::string const &uuid) const {
  auto const entry{ meta_dir() / uuid };
  if (!platform::file_exists(entry / kCompleteMarker)) { return std::nullopt; }
  return artifact_index_read(util_load_text_file(entry / kIndexFile));
}

std::vector<artifact_location> artifact_repository::retrieve(
    std::vector<std::string> const &uuids,
    path const &target_repo) const {
  std::vector<artifact_location> locations;

  for (auto const &uuid : uuids) {
    auto const artifacts{ lookup(uuid) };
    if (!artifacts) {
      throw std::runtime_error("Artifacts of build " + uuid +
                               " are not in the repository");
    }

    std::int64_t files{ 0 };
    for (auto const &sub : artifacts->results) {
      for (auto const &s : sub.shas) {
        auto const dest{ target_repo / s.location };
        std::filesystem::create_directories(dest.parent_path());
        std::filesystem::copy_file(raw_dir() / s.sha,
                                   dest,
                                   std::filesystem::copy_options::overwrite_existing);
        ++files;
      }
      locations.insert(locations.end(), sub.artifacts.begin(), sub.artifacts.end());
    }

    DBUILD_TRACE_REPOSITORY_RETRIEVE(uuid, files);
  }

  return locations;
}

}  // namespace dbuild
