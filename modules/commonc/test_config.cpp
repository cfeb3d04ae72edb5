#include <catch2/catch.hpp>

#include <boost/filesystem/fstream.hpp>

#include <proofagg/common/config.hpp>

#include "mocks.hpp"

using namespace pagg;

TEST_CASE("Config provides defaults without parsing", "[commonc][config]") {
  Config config;
  CHECK(config.getString(Config::DatabasePath) == "proofagg.sqlite");
  CHECK(config.getString(Config::ObjectStoreMode) == "file");
  CHECK(config.getUint64(Config::PollingIntervalMS) == 1000);
  CHECK(config.getUint64(Config::MaxJobs) == 0);
  CHECK(config.getUint64(Config::ProcessingTimeoutMS) == 3600000);
  CHECK(config.getUint32(Config::MaxAttempts) == 3);
  CHECK(config.getUint64(Config::SchedulerCapacity) == 16384);
  CHECK(config.getUint32(Config::SchedulerDependencyCount) == 13);
  CHECK(config.getUint32(Config::ThreadCount) > 0);
  CHECK(!config.getString(Config::LocalName).empty());
  CHECK(!config.isDebugMode());
}

TEST_CASE("Config reads the command line", "[commonc][config]") {
  Config config;
  const char* argv[] = { "proofagg-scheduler",
                         "--threads",
                         "3",
                         "--object-store",
                         "memory",
                         "--max-jobs",
                         "5",
                         "--scheduler-dependency-count",
                         "3",
                         "--processing-timeout-ms",
                         "0",
                         "--max-attempts",
                         "1",
                         "-d",
                         nullptr };
  REQUIRE(config.parseParameters(14, const_cast<char**>(argv)));
  CHECK(config.getUint32(Config::ThreadCount) == 3);
  CHECK(config.getString(Config::ObjectStoreMode) == "memory");
  CHECK(config.getUint64(Config::MaxJobs) == 5);
  CHECK(config.getUint32(Config::SchedulerDependencyCount) == 3);
  CHECK(config.getUint64(Config::ProcessingTimeoutMS) == 0);
  CHECK(config.getUint32(Config::MaxAttempts) == 1);
  CHECK(config.getKeyAsString(Config::MaxJobs) == "5");
  CHECK(config.isDebugMode());
}

TEST_CASE("Command line takes precedence over the config file",
          "[commonc][config]") {
  TempDir dir;
  {
    boost::filesystem::ofstream o(dir.path() / "proofagg.ini");
    o << "threads = 5\n"
      << "database = from_file.sqlite\n"
      << "polling-interval-ms = 50\n";
  }
  const std::string path = dir.file("proofagg.ini");

  Config config;
  const char* argv[] = {
    "proofagg-scheduler", "--config", path.c_str(), "--threads", "3", nullptr
  };
  REQUIRE(config.parseParameters(5, const_cast<char**>(argv)));
  CHECK(config.getUint32(Config::ThreadCount) == 3);
  CHECK(config.getString(Config::DatabasePath) == "from_file.sqlite");
  CHECK(config.getUint64(Config::PollingIntervalMS) == 50);
  CHECK(config.getString(Config::ConfigFile) == path);
}

TEST_CASE("Invalid configuration is rejected", "[commonc][config]") {
  Config config;

  SECTION("Unknown object store") {
    const char* argv[] = {
      "proofagg-scheduler", "--object-store", "s3", nullptr
    };
    REQUIRE(!config.parseParameters(3, const_cast<char**>(argv)));
  }
  SECTION("No worker threads") {
    const char* argv[] = { "proofagg-scheduler", "--threads", "0", nullptr };
    REQUIRE(!config.parseParameters(3, const_cast<char**>(argv)));
  }
  SECTION("Scheduler circuit without capacity") {
    const char* argv[] = {
      "proofagg-scheduler", "--scheduler-capacity", "0", nullptr
    };
    REQUIRE(!config.parseParameters(3, const_cast<char**>(argv)));
  }
  SECTION("Scheduler jobs without dependencies") {
    const char* argv[] = {
      "proofagg-scheduler", "--scheduler-dependency-count", "0", nullptr
    };
    REQUIRE(!config.parseParameters(3, const_cast<char**>(argv)));
  }
  SECTION("Missing config file") {
    const char* argv[] = {
      "proofagg-scheduler", "--config", "/nonexistent/proofagg.ini", nullptr
    };
    REQUIRE(!config.parseParameters(3, const_cast<char**>(argv)));
  }
}
