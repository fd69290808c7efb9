#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace mt;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      mt::LogHandler::setupLogHandler(&argc, &argv);
  mt::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  mt::HandleTerminate();
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }

  string logDirectoryPattern = GetTempDirectory() + string("mt_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  mt::LogHandler::setupLogFiles(&defaultConf, logDirectory, "multiterm_test",
                                false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
