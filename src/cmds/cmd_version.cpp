#include "cmd_version.h"

#include "tui.h"

#include "CLI11.hpp"
#include "blake3.h"
#include "git2.h"
#include "libxml/xmlversion.h"
#include "mbedtls/version.h"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <array>

#ifndef DBUILD_VERSION_STR
#error "DBUILD_VERSION_STR must be defined by the build system"
#endif

namespace dbuild {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  sub->callback([on_selected = std::move(on_selected)] { on_selected(cfg{}); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("dbuild version %s", DBUILD_VERSION_STR);
  tui::info("");
  tui::info("Third-party component versions:");

  int git_major{ 0 };
  int git_minor{ 0 };
  int git_revision{ 0 };
  git_libgit2_version(&git_major, &git_minor, &git_revision);
  tui::info("  libgit2: %d.%d.%d", git_major, git_minor, git_revision);

  std::array<char, 32> mbedtls_version{};
  mbedtls_version_get_string_full(mbedtls_version.data());
  tui::info("  mbedTLS: %s", mbedtls_version.data());

  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  libxml2: %s", LIBXML_DOTTED_VERSION);
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace dbuild
