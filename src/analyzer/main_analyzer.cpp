#include "analyzer.hpp"
#include <iostream>

using namespace rawlink;

int main(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: rawlink_analyze <container>...\n";
    return 2;
  }
  bool all_valid = true;
  for (int i = 1; i < argc; i++) {
    CorruptionReport r = analyze_file(argv[i]);
    std::cout << format_report(r, argv[i]);
    if (i + 1 < argc)
      std::cout << "\n";
    all_valid = all_valid && r.overall_valid;
  }
  return all_valid ? 0 : 1;
}
