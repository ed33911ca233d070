#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "app.hpp"
#include <optional>
#include <filesystem>

int main(int argc, char** argv) {
  AppOptions opts;
  if (argc >= 2) opts.data_file = std::filesystem::path(argv[1]);
  Terminal term;
  NcursesTerminal backend;
  App app(backend, opts);
  app.run();
  return 0;
}
