#include "catmatch/core/version.h"

#include "commands/import_catalog.h"
#include "commands/match.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "catalog-match v" << catmatch::core::kBuildVersion << "\n"
            << "Usage: catmatch_cli <command> [options]\n"
            << "Commands:\n"
            << "  match            Match unstructured descriptions against a catalog\n"
            << "  import-catalog   Load a catalog CSV into a SQLite database\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "match") {
    return cmd_match(argc, argv);
  }
  if (subcommand == "import-catalog") {
    return cmd_import_catalog(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
