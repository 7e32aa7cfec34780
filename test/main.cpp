// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: Catch2 session with a --loglevel option for the spdlog sinks

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string &level);
void ShutdownTestLogging();

int main(int argc, char *argv[]) {
  Catch::Session session;

  // Quiet by default; --loglevel=trace shows the core's rejection traces
  std::string log_level = "off";
  using namespace Catch::Clara;
  auto cli = session.cli() |
             Opt(log_level, "level")["--loglevel"](
                 "spdlog level for the test run (trace..off, default off)");
  session.cli(cli);

  int rc = session.applyCommandLine(argc, argv);
  if (rc != 0) {
    return rc;
  }

  InitializeTestLogging(log_level);
  int result = session.run();
  ShutdownTestLogging();
  return result;
}
