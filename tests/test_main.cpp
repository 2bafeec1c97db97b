#include "mailsync/util/log.hpp"

#include <csignal>
#include <gtest/gtest.h>

int main(int argc, char **argv) {
  // Global signal handling for tests
  std::signal(SIGPIPE, SIG_IGN);

  mailsync::log::set_output_stderr();
  mailsync::log::set_level(mailsync::log::Level::Error);
  mailsync::log::ScopedLogger logger;

  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
