#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace mt {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity is set explicitly from the parsed command line, easylogging's
  // own --v flags are only honored for ad-hoc debugging.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread is the name given by el::Helpers::setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &directory, const string &prefix,
                                 bool logToStdout, const string &maxLogSize) {
  time_t rawtime;
  struct tm timeinfo;
  char buffer[80];
  time(&rawtime);
  localtime_r(&rawtime, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  // Several multiterm processes may start within the same second
  string logFilename =
      prefix + "-" + buffer + "-" + std::to_string(getpid()) + ".log";
  string fullFname = createLogFile(directory, logFilename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return fullFname;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // Runs while the log file is closed, so nothing here may log
  string previous = string(filename) + ".1";
  if (::rename(filename, previous.c_str()) != 0) {
    ::remove(filename);
  }
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    throw std::runtime_error(string("Cannot create log directory: ") +
                             fse.what());
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + fullFname + ": " +
                             strerror(errno));
  }
  ::close(fd);
  return fullFname;
}
}  // namespace mt
