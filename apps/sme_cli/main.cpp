#include "commands/circles.h"
#include "commands/match.h"
#include "commands/predict.h"
#include "commands/recommend.h"
#include "commands/schedule.h"

#include "sme/core/version.h"

#include <stdexcept>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "study-match-engine v" << sme::core::kBuildVersion << "\n"
            << "Usage: sme_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  match      Rank compatible study partners for a requester\n"
            << "  schedule   Find meeting windows shared by several participants\n"
            << "  recommend  Recommend partners (collaborative, content or hybrid)\n"
            << "  circles    List study circles in the partnership graph\n"
            << "  predict    Project completion of a study-hours goal\n\n"
            << "Pool source (match, schedule, recommend, circles):\n"
            << "  --pool <file.json> | --db <file.sqlite>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  try {
    if (subcommand == "match") {
      return cmd_match(argc, argv);
    }
    if (subcommand == "schedule") {
      return cmd_schedule(argc, argv);
    }
    if (subcommand == "recommend") {
      return cmd_recommend(argc, argv);
    }
    if (subcommand == "circles") {
      return cmd_circles(argc, argv);
    }
    if (subcommand == "predict") {
      return cmd_predict(argc, argv);
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << subcommand << " failed: " << e.what() << "\n";
    return 1;
  }

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_usage();
    return 0;
  }
  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
