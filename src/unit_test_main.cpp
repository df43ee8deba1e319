#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

#include "source.h"
#include "tui.h"
#include "xml_util.h"

#include <string_view>

int main(int argc, char **argv) {
  doctest::Context context;
  context.applyCommandLine(argc, argv);

  dbuild::tui::init();
  dbuild::tui::set_output_handler([](std::string_view) {});

  dbuild::libgit2_scope git;
  dbuild::libxml2_scope xml;

  return context.run();
}
