#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "PanelConfig.hpp"
#include "PanelHost.hpp"
#include "PathResolver.hpp"
#include "PseudoTerminalConsole.hpp"
#include "PtySessionManager.hpp"

using namespace pt;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  pt::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, pt::InterruptSignalHandler);

  cxxopts::Options options("panelterm",
                           "Shell session on a pseudo-terminal, embeddable in "
                           "a host panel");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell to launch (default: $SHELL)",
         cxxopts::value<std::string>())  //
        ("cwd", "Working directory of the session",
         cxxopts::value<std::string>())  //
        ("c,command",
         "Run this command directly instead of an interactive shell",
         cxxopts::value<std::string>())                               //
        ("autolaunch", "Type the launch command once the shell starts")  //
        ("flags", "Extra flags appended to the launch command",
         cxxopts::value<std::string>())  //
        ("saveconfig", "Write the effective settings to the config file")  //
        ("logtostdout", "log to stdout")                                  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "panelterm version " << PT_VERSION << endl;
      exit(0);
    }

    string cfgfilename = result["cfgfile"].as<string>();
    if (cfgfilename.empty()) {
      cfgfilename = PanelConfig::getDefaultPath();
    }
    PanelConfig config = PanelConfig::load(cfgfilename);

    if (result.count("shell")) {
      config.shellPath = result["shell"].as<string>();
    }
    if (result.count("cwd")) {
      config.cwd = result["cwd"].as<string>();
    }
    if (result.count("autolaunch")) {
      config.autoLaunch = true;
    }
    if (result.count("flags")) {
      config.launchFlags = result["flags"].as<string>();
    }
    if (result.count("command")) {
      config.autoLaunch = true;
      config.launchDirect = true;
      config.launchCommand = result["command"].as<string>();
      config.launchFlags.clear();
    }

    if (result.count("saveconfig")) {
      config.save(cfgfilename);
      CLOG(INFO, "stdout") << "Saved settings to " << cfgfilename << endl;
      exit(0);
    }

    // prioritize command line option over cfgfile
    if (result.count("verbose") && result["verbose"].as<int>() > 0) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    bool logToStdout = result.count("logtostdout") > 0;
    string logDirectory = config.logDirectory.empty()
                              ? GetTempDirectory() + "panelterm"
                              : config.logDirectory;
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "panelterm",
                              logToStdout, !logToStdout, true,
                              config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("panelterm-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    auto pathResolver = std::make_shared<PathResolver>();
    auto manager = std::make_shared<PtySessionManager>(pathResolver);
    auto console = std::make_shared<PseudoTerminalConsole>();
    PanelHost host(console, manager, config);
    int exitCode = host.run();
    CLOG(INFO, "stdout") << "\r\nSession terminated" << endl;
    return exitCode;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(ERROR, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }
}
