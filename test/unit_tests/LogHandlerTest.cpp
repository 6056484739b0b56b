#include "LogHandler.hpp"

#include "TestHeaders.hpp"

using namespace muxcore;

TEST_CASE("Log files are created with a size limit", "[LogHandler]") {
  string logDirectoryPattern =
      GetTempDirectory() + string("muxcore_log_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));

  el::Configurations conf;
  conf.setToDefault();
  LogHandler::setupLogFiles(&conf, logDirectory + "/nested", "muxctl", false,
                            true, "4096");

  string filename =
      conf.get(el::Level::Global, el::ConfigurationType::Filename)->value();
  REQUIRE(fs::exists(filename));
  REQUIRE(fs::path(filename).parent_path() ==
          fs::path(logDirectory + "/nested"));
  string pidSuffix = "_" + std::to_string(getpid()) + ".log";
  REQUIRE(filename.size() > pidSuffix.size());
  REQUIRE(filename.compare(filename.size() - pidSuffix.size(),
                           pidSuffix.size(), pidSuffix) == 0);
  REQUIRE(fs::path(filename).filename().string().rfind("muxctl-", 0) == 0);
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::MaxLogFileSize)
              ->value() == "4096");
  REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::ToStandardOutput)
              ->value() == "false");

  fs::remove_all(logDirectory);
}
