#include "TerminalConfig.hpp"

#include "SimpleIni.h"

namespace mt {
namespace {
int getInt(CSimpleIniA& ini, const char* section, const char* key,
           int defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL || !strlen(value)) {
    return defaultValue;
  }
  try {
    return stoi(value);
  } catch (const std::logic_error&) {
    LOG(WARNING) << "Ignoring invalid value for " << section << "." << key
                 << ": " << value;
    return defaultValue;
  }
}

double getDouble(CSimpleIniA& ini, const char* section, const char* key,
                 double defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL || !strlen(value)) {
    return defaultValue;
  }
  try {
    return stod(value);
  } catch (const std::logic_error&) {
    LOG(WARNING) << "Ignoring invalid value for " << section << "." << key
                 << ": " << value;
    return defaultValue;
  }
}

string getString(CSimpleIniA& ini, const char* section, const char* key,
                 const string& defaultValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  return string(value);
}

TerminalConfig fromIni(CSimpleIniA& ini) {
  TerminalConfig config;
  config.shell = getString(ini, "Terminal", "shell", config.shell);
  config.directory = getString(ini, "Terminal", "directory", config.directory);
  config.fontFamily =
      getString(ini, "Terminal", "font_family", config.fontFamily);
  config.fontSize = getDouble(ini, "Terminal", "font_size", config.fontSize);
  config.scrollback = getInt(ini, "Terminal", "scrollback", config.scrollback);
  config.theme = getString(ini, "Terminal", "theme", config.theme);

  config.resizeDebounceMs =
      getInt(ini, "Behavior", "resize_debounce_ms", config.resizeDebounceMs);
  config.fitRetryMs = getInt(ini, "Behavior", "fit_retry_ms", config.fitRetryMs);
  config.maxFitRetries =
      getInt(ini, "Behavior", "max_fit_retries", config.maxFitRetries);
  config.softErrorThreshold = getInt(ini, "Behavior", "soft_error_threshold",
                                     config.softErrorThreshold);

  config.verbose = getInt(ini, "Debug", "verbose", config.verbose);
  // make sure logsize is a string of int value
  int logSize = getInt(ini, "Debug", "logsize", 0);
  if (logSize > 0) {
    config.logSize = to_string(logSize);
  }
  config.logToStdout = getInt(ini, "Debug", "logtostdout", 0) != 0;

  if (config.fontSize <= 0) {
    LOG(WARNING) << "Invalid font size " << config.fontSize
                 << ", using the default";
    config.fontSize = TerminalConfig().fontSize;
  }
  if (config.softErrorThreshold < 1) {
    config.softErrorThreshold = 1;
  }
  return config;
}
}  // namespace

string TerminalConfig::defaultPath() {
  return sago::getConfigHome() + "/multiterm/multiterm.ini";
}

TerminalConfig TerminalConfig::load(const string& path) {
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return TerminalConfig();
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    STFATAL << "Invalid config file: " << path;
  }
  LOG(INFO) << "Loaded config from " << path;
  return fromIni(ini);
}

TerminalConfig TerminalConfig::parse(const string& iniData) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadData(iniData);
  if (rc < 0) {
    STFATAL << "Invalid config data";
  }
  return fromIni(ini);
}

SurfaceConfig TerminalConfig::surfaceConfig() const {
  SurfaceConfig config;
  config.render.fontFamily = fontFamily;
  config.render.fontSize = fontSize;
  config.render.theme = theme;
  config.render.scrollback = scrollback;
  config.resizeDebounce = std::chrono::milliseconds(resizeDebounceMs);
  config.fitRetryDelay = std::chrono::milliseconds(fitRetryMs);
  config.maxFitRetries = maxFitRetries;
  return config;
}

string TerminalConfig::startDirectory() const {
  if (!directory.empty()) {
    return directory;
  }
  return fs::current_path().string();
}
}  // namespace mt
