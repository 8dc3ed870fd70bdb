#include "app.hpp"

#include <spdlog/spdlog.h>

/**
 * Program entry point.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application.
 */
int main(int argc, char **argv) {
  ghrc::App app;
  int rc = app.run(argc, argv);
  spdlog::shutdown();
  return rc;
}
