#include "source.h"

#include "errors.h"
#include "tui.h"

#include <git2.h>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>

namespace dbuild {

namespace {

constexpr std::size_t kCommitIdLength{ 40 };

std::string git_error_message(std::string msg) {
  if (git_error const *err{ git_error_last() }; err && err->message) {
    msg += ": ";
    msg += err->message;
  }
  return msg;
}

bool is_commit_id(std::string_view ref) {
  return ref.size() == kCommitIdLength && std::ranges::all_of(ref, [](char c) {
           return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
         });
}

// Commit id a remote advertises for `ref`, trying it as given, as a branch and as a tag.
// Annotated tags resolve to the commit they point at.
std::string git_ls_remote(std::string const &url, std::string const &ref) {
  git_remote *remote_raw{ nullptr };
  if (git_remote_create_anonymous(&remote_raw, nullptr, url.c_str())) {
    throw std::runtime_error(git_error_message("git: invalid remote " + url));
  }
  std::unique_ptr<git_remote, decltype(&git_remote_free)> remote{ remote_raw,
                                                                  git_remote_free };

  git_remote_callbacks callbacks;
  git_remote_init_callbacks(&callbacks, GIT_REMOTE_CALLBACKS_VERSION);
  if (git_remote_connect(remote.get(), GIT_DIRECTION_FETCH, &callbacks, nullptr, nullptr)) {
    throw std::runtime_error(git_error_message("git: cannot connect to " + url));
  }

  git_remote_head const **heads{ nullptr };
  size_t count{ 0 };
  if (git_remote_ls(&heads, &count, remote.get())) {
    throw std::runtime_error(git_error_message("git: cannot list refs of " + url));
  }

  for (auto const &candidate : { ref, "refs/heads/" + ref, "refs/tags/" + ref }) {
    std::optional<git_oid> found;
    for (size_t i{ 0 }; i < count; ++i) {
      std::string_view const name{ heads[i]->name };
      if (name == candidate + "^{}") {
        found = heads[i]->oid;
        break;
      }
      if (name == candidate) { found = heads[i]->oid; }
    }
    if (found) {
      char hex[kCommitIdLength + 1]{};
      git_oid_tostr(hex, sizeof(hex), &*found);
      return hex;
    }
  }
  throw std::runtime_error("git: " + url + " has no ref '" + ref + "'");
}

void git_checkout(std::string const &url,
                  std::string const &commit,
                  std::filesystem::path const &dest) {
  git_clone_options clone_opts;
  git_clone_options_init(&clone_opts, GIT_CLONE_OPTIONS_VERSION);

  git_repository *repo_raw{ nullptr };
  if (git_clone(&repo_raw, url.c_str(), dest.string().c_str(), &clone_opts)) {
    throw std::runtime_error(git_error_message("git: clone of " + url + " failed"));
  }
  std::unique_ptr<git_repository, decltype(&git_repository_free)> repo{
    repo_raw,
    git_repository_free
  };

  git_object *target_raw{ nullptr };
  if (git_revparse_single(&target_raw, repo.get(), commit.c_str())) {
    throw std::runtime_error(git_error_message("git: " + url + " has no commit " + commit));
  }
  std::unique_ptr<git_object, decltype(&git_object_free)> target{ target_raw,
                                                                  git_object_free };

  git_checkout_options checkout_opts;
  git_checkout_options_init(&checkout_opts, GIT_CHECKOUT_OPTIONS_VERSION);
  checkout_opts.checkout_strategy = GIT_CHECKOUT_FORCE;

  if (git_checkout_tree(repo.get(), target.get(), &checkout_opts)) {
    throw std::runtime_error(git_error_message("git: checkout of " + commit + " failed"));
  }
  if (git_repository_set_head_detached(repo.get(), git_object_id(target.get()))) {
    throw std::runtime_error(git_error_message("git: failed to update HEAD"));
  }
}

}  // namespace

libgit2_scope::libgit2_scope() { git_libgit2_init(); }
libgit2_scope::~libgit2_scope() { git_libgit2_shutdown(); }

source_uri source_parse(std::string_view uri) {
  if (uri == "nil" || uri.starts_with("nil:")) {
    return { .scheme = source_scheme::nil, .location = {}, .ref = {} };
  }

  if (uri.starts_with("file:")) {
    auto const path{ uri.substr(5) };
    if (path.empty()) { throw configuration_error("Empty path in uri " + std::string{ uri }); }
    return { .scheme = source_scheme::file, .location = std::string{ path }, .ref = {} };
  }

  if (uri.starts_with("git:")) {
    auto const rest{ uri.substr(4) };
    auto const hash{ rest.rfind('#') };
    if (hash == std::string_view::npos || hash == 0 || hash + 1 == rest.size()) {
      throw configuration_error("Git uri must look like git:<url>#<ref>: " +
                                std::string{ uri });
    }
    return { .scheme = source_scheme::git,
             .location = std::string{ rest.substr(0, hash) },
             .ref = std::string{ rest.substr(hash + 1) } };
  }

  throw configuration_error("Unsupported source uri: " + std::string{ uri });
}

std::string source_resolve(std::string_view uri) {
  auto const parsed{ source_parse(uri) };
  switch (parsed.scheme) {
    case source_scheme::nil: return std::string{ uri };

    case source_scheme::file: {
      auto const path{ std::filesystem::absolute(parsed.location).lexically_normal() };
      if (!std::filesystem::is_directory(path)) {
        throw std::runtime_error("Source directory does not exist: " + path.string());
      }
      return "file:" + path.generic_string();
    }

    case source_scheme::git: {
      if (is_commit_id(parsed.ref)) { return std::string{ uri }; }
      auto const commit{ git_ls_remote(parsed.location, parsed.ref) };
      tui::debug("Pinned %s#%s to %s",
                 parsed.location.c_str(),
                 parsed.ref.c_str(),
                 commit.c_str());
      return "git:" + parsed.location + "#" + commit;
    }
  }
  return std::string{ uri };
}

void source_checkout(std::string_view uri, std::filesystem::path const &dest) {
  auto const parsed{ source_parse(uri) };
  if (parsed.scheme == source_scheme::git && !is_commit_id(parsed.ref)) {
    throw internal_error("checkout of unresolved git uri " + std::string{ uri });
  }

  std::filesystem::remove_all(dest);
  switch (parsed.scheme) {
    case source_scheme::nil: std::filesystem::create_directories(dest); break;

    case source_scheme::file:
      std::filesystem::create_directories(dest.parent_path());
      std::filesystem::copy(parsed.location,
                            dest,
                            std::filesystem::copy_options::recursive |
                                std::filesystem::copy_options::copy_symlinks);
      break;

    case source_scheme::git:
      git_checkout(parsed.location, parsed.ref, dest);
      break;
  }
}

}  // namespace dbuild
