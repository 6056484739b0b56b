#include <cxxopts.hpp>

#include "ColorConfig.hpp"
#include "ColorSchemeRegistry.hpp"
#include "LogHandler.hpp"
#include "Mux.hpp"
#include "SimpleIni.h"

using namespace muxcore;

namespace {
string defaultConfigPath() {
  return sago::getConfigHome() + "/muxcore/muxcore.ini";
}

json paletteToJson(const Palette &palette) {
  json j = palette;
  return j;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  muxcore::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, muxcore::InterruptSignalHandler);

  cxxopts::Options options("muxctl",
                           "Inspect the mux hierarchy and color schemes");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("default-colors", "Print the default palette as JSON")  //
        ("builtin-schemes", "Print every builtin scheme as JSON")  //
        ("list-schemes", "Print the names of the builtin schemes")  //
        ("scheme", "Print one resolved scheme as JSON",
         cxxopts::value<std::string>(), "NAME")  //
        ("demo-tabs", "Spawn N tabs in a window and print tabs_with_info",
         cxxopts::value<int>(), "N")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "muxctl version " << MUXCORE_VERSION << endl;
      exit(0);
    }

    // default max log file size is 20MB
    string maxlogsize = "20971520";

    auto registry = ColorSchemeRegistry::get();
    ColorConfig colorConfig;

    string cfgfilename = result["cfgfile"].as<string>();
    bool explicitConfig = !cfgfilename.empty();
    if (!explicitConfig) {
      cfgfilename = defaultConfigPath();
    }
    if (explicitConfig || fs::exists(cfgfilename)) {
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      // read verbose level (prioritize command line option over cfgfile)
      const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
      if (result.count("verbose")) {
        el::Loggers::setVerboseLevel(result["verbose"].as<int>());
      } else if (vlevel) {
        el::Loggers::setVerboseLevel(atoi(vlevel));
      }
      // read silent setting
      const char *silent = ini.GetValue("Debug", "silent", NULL);
      if (silent && atoi(silent) != 0) {
        defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
      }
      // read log file size limit
      const char *logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        // make sure maxlogsize is a string of int value
        maxlogsize = string(logsize);
      }
      try {
        colorConfig = ColorConfig::load(ini, *registry);
      } catch (const std::runtime_error &re) {
        CLOG(ERROR, "stdout") << "Bad color settings in " << cfgfilename
                              << ": " << re.what() << endl;
        exit(1);
      }
    } else {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "muxctl",
                              "muxctl", result.count("logtostdout") > 0, true,
                              maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("muxctl-main");

    int exitCode = 0;
    try {
      if (result.count("default-colors")) {
        CLOG(INFO, "stdout")
            << paletteToJson(registry->getDefaultColors()).dump(2) << endl;
      }
      if (result.count("list-schemes")) {
        for (const auto &name : registry->getBuiltinSchemeNames()) {
          CLOG(INFO, "stdout") << name << endl;
        }
      }
      if (result.count("builtin-schemes")) {
        json schemes = json::object();
        for (auto &it : registry->getBuiltinSchemes()) {
          schemes[it.first] = paletteToJson(it.second);
        }
        CLOG(INFO, "stdout") << schemes.dump(2) << endl;
      }
      if (result.count("scheme")) {
        string name = result["scheme"].as<string>();
        CLOG(INFO, "stdout")
            << paletteToJson(registry->resolveColorScheme(
                                 name, colorConfig.colorSchemes))
                   .dump(2)
            << endl;
      }
      if (result.count("demo-tabs")) {
        int numTabs = result["demo-tabs"].as<int>();
        Mux mux;
        WindowId windowId = mux.newWindow();
        for (int a = 0; a < numTabs; a++) {
          mux.spawnTab(windowId, SpawnCommand(), a == 0);
        }
        json infos = json::array();
        for (const auto &info : mux.tabsWithInfo(windowId)) {
          infos.push_back(info.toJson());
        }
        CLOG(INFO, "stdout") << infos.dump(2) << endl;
        VLOG(1) << mux.toJsonString();
      }
    } catch (const NotFoundError &nfe) {
      CLOG(ERROR, "stdout") << nfe.what() << endl;
      exitCode = 1;
    }

    return exitCode;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }
}
