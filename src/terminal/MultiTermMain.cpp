#include "Clipboard.hpp"
#include "EventBus.hpp"
#include "EventLoop.hpp"
#include "HeadlessRenderEngine.hpp"
#include "LogHandler.hpp"
#include "PtyBackend.hpp"
#include "TerminalConfig.hpp"
#include "TerminalManager.hpp"
#include "cxxopts.hpp"

using namespace mt;

namespace {
const int PANEL_WIDTH = 800;
const int PANEL_HEIGHT = 480;
const std::chrono::milliseconds WATCH_INTERVAL(50);
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();
  HandleTerminate();
  ::signal(SIGINT, InterruptSignalHandler);

  cxxopts::Options options("multiterm",
                           "Runs several shell sessions side by side");

  try {
    options.add_options()         //
        ("h,help", "Print help")  //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell to run in every session",
         cxxopts::value<std::string>())  //
        ("dir", "Working directory of every session",
         cxxopts::value<std::string>())  //
        ("sessions", "Number of sessions to open",
         cxxopts::value<int>()->default_value("1"))  //
        ("command", "Command line sent to every session once it is ready",
         cxxopts::value<std::string>()->default_value(""))  //
        ("duration",
         "Seconds to run before exiting, 0 waits until every shell exits",
         cxxopts::value<int>()->default_value("0"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("logtostdout", "Write log to stdout")       //
        ("dump", "Print the session registry as JSON before exiting")  //
        ;

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "multiterm version " << MT_VERSION << endl;
      exit(0);
    }

    string cfgfile = result["cfgfile"].as<string>();
    if (cfgfile.empty()) {
      cfgfile = TerminalConfig::defaultPath();
    }
    TerminalConfig config = TerminalConfig::load(cfgfile);
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    if (result.count("dir")) {
      config.directory = result["dir"].as<string>();
    }
    bool logToStdout = config.logToStdout || result.count("logtostdout");
    // prioritize command line option over cfgfile
    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    } else {
      el::Loggers::setVerboseLevel(config.verbose);
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      STFATAL << "libsodium init failed";
    }

    try {
      LogHandler::setupLogFiles(&defaultConf, GetTempDirectory(), "multiterm",
                                logToStdout, config.logSize);
    } catch (const std::runtime_error& ex) {
      CLOG(ERROR, "stdout") << ex.what() << endl;
      exit(1);
    }
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("multiterm-main");

    int numSessions = max(1, result["sessions"].as<int>());
    string command = result["command"].as<string>();
    int duration = result["duration"].as<int>();

    shared_ptr<EventLoop> loop(new EventLoop());
    shared_ptr<EventBus> bus(new EventBus());
    shared_ptr<PtyBackend> backend(new PtyBackend(loop, bus));
    shared_ptr<Clipboard> clipboard(new InMemoryClipboard());
    shared_ptr<TerminalManager> manager(
        new TerminalManager(loop, bus, backend, headlessRenderEngineFactory(),
                            clipboard, config));

    manager->setTerminatedHandler([manager, loop](const string& sessionId,
                                                  int exitStatus) {
      CLOG(INFO, "stdout") << "Session " << sessionId << " exited with status "
                           << exitStatus << endl;
      if (manager->numRunning() == 0) {
        loop->stop();
      }
    });

    manager->mount(PANEL_WIDTH, PANEL_HEIGHT);
    for (int a = 1; a < numSessions; a++) {
      manager->openSession();
    }

    // Sends the command once every session is connected, and stops the
    // loop if no shell could be started at all.
    bool commandSent = command.empty();
    std::function<void()> watch;
    watch = [&]() {
      if (!commandSent) {
        bool allReady = true;
        for (auto& session : manager->getRegistry()->all()) {
          auto surface = manager->getSurface(session->id);
          if (!surface || surface->getState() == SurfaceState::INITIALIZING) {
            allReady = false;
          }
        }
        if (allReady) {
          for (auto& session : manager->getRegistry()->all()) {
            manager->sendInput(session->id, command + "\r");
          }
          commandSent = true;
        }
      }
      if (manager->numRunning() == 0) {
        LOG(INFO) << "No shell is running";
        loop->stop();
        return;
      }
      loop->postDelayed(WATCH_INTERVAL, watch);
    };
    loop->postDelayed(WATCH_INTERVAL, watch);
    if (duration > 0) {
      loop->postDelayed(std::chrono::seconds(duration),
                        [loop]() { loop->stop(); });
    }

    loop->run();

    for (auto& session : manager->getRegistry()->all()) {
      auto surface = manager->getSurface(session->id);
      CLOG(INFO, "stdout") << "=== " << session->name << " ===" << endl;
      if (!surface) {
        continue;
      }
      if (surface->getState() == SurfaceState::ERRORED) {
        CLOG(INFO, "stdout") << "Error: " << surface->getErrorMessage()
                             << endl;
      } else {
        CLOG(INFO, "stdout") << surface->serialize() << endl;
      }
    }
    if (result.count("dump")) {
      CLOG(INFO, "stdout") << manager->getRegistry()->toJsonString() << endl;
    }
    manager->setTerminatedHandler(nullptr);
    manager->shutdown();
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
