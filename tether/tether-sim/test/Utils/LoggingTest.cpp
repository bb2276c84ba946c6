// Ticket: 0004_logging

#include <gtest/gtest.h>

#include "tether-sim/src/Utils/Logging.hpp"

using namespace tether_sim;

TEST(LoggingTest, getLogger_CreatesDebugLogger)
{
  auto logger = logging::getLogger("tether-logging-test-create");

  ASSERT_NE(nullptr, logger);
  EXPECT_EQ("tether-logging-test-create", logger->name());
  EXPECT_EQ(spdlog::level::debug, logger->level());
}

TEST(LoggingTest, getLogger_SameName_SameInstance)
{
  auto first = logging::getLogger("tether-logging-test-shared");
  auto second = logging::getLogger("tether-logging-test-shared");

  EXPECT_EQ(first.get(), second.get());
}

TEST(LoggingTest, getLogger_ReusesRegisteredLogger)
{
  auto existing = logging::getLogger("tether-logging-test-existing");
  existing->set_level(spdlog::level::warn);

  auto fetched = logging::getLogger("tether-logging-test-existing");

  EXPECT_EQ(spdlog::level::warn, fetched->level());
}
