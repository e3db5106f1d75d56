#include "logger.h"

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

int main() {
  Logger &log = Logger::Instance();
  log.Log("logger test info line");
  log.Warn("logger test warning line");
  log.Error("logger test error line");
  log.Flush();

  std::ifstream in("qrstudio.log");
  if (!in.is_open()) {
    std::cerr << "qrstudio.log was not created" << std::endl;
    return 1;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string content = ss.str();

  const char *expected[] = {"[INFO] logger test info line",
                            "[WARN] logger test warning line",
                            "[ERROR] logger test error line"};
  size_t last = 0;
  for (const char *line : expected) {
    const size_t pos = content.find(line);
    if (pos == std::string::npos || pos < last) {
      std::cerr << "Missing or out of order: " << line << std::endl;
      return 1;
    }
    last = pos;
  }

  // Flushing an empty queue returns immediately.
  log.Flush();
  return 0;
}
