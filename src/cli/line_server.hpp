#pragma once

#include "../common/log.hpp"
#include "command_handler.hpp"
#include <iostream>
#include <string>

namespace cue::cli {

// `cue serve`: one command per input line, one JSON line back, until EOF
// or "quit".
class LineServer {
public:
  explicit LineServer(CommandHandler &handler) : handler(handler) {}

  void run(std::istream &in = std::cin, std::ostream &out = std::cout) {
    log::info("Serve", "ready");
    std::string line;
    while (std::getline(in, line)) {
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      if (line.empty()) continue;
      if (line == "quit" || line == "exit") break;

      out << handler.execute(line) << std::endl;
      out.flush();
    }
    log::info("Serve", "input closed");
  }

private:
  CommandHandler &handler;
};

} // namespace cue::cli
