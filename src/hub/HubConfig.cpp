#include "HubConfig.hpp"

#include "SimpleIni.h"

namespace sb {
namespace {
int64_t readInteger(const CSimpleIniA &ini, const char *section,
                    const char *key, int64_t defaultValue) {
  const char *value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    int64_t parsed = stoll(value, &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error &e) {
    throw runtime_error(string("Invalid value for [") + section + "] " + key +
                        ": " + value);
  }
}
}  // namespace

HubConfig parseHubConfigFile(const string &path, const HubConfig &defaults) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw runtime_error("Invalid config file: " + path);
  }

  HubConfig config = defaults;
  config.port = int(readInteger(ini, "Networking", "port", config.port));
  const char *bindIp = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIp) {
    config.bindIp = bindIp;
  }

  const char *adminKey = ini.GetValue("Hub", "admin_public_key", NULL);
  if (adminKey) {
    config.adminPublicKey = adminKey;
  }
  config.probe.interval = std::chrono::milliseconds(readInteger(
      ini, "Hub", "probe_interval_ms", config.probe.interval.count()));
  config.probe.timeout = std::chrono::milliseconds(readInteger(
      ini, "Hub", "probe_timeout_ms", config.probe.timeout.count()));
  config.probe.attempts =
      int(readInteger(ini, "Hub", "probe_attempts", config.probe.attempts));
  config.probe.retryDelay = std::chrono::milliseconds(readInteger(
      ini, "Hub", "sweep_retry_delay_ms", config.probe.retryDelay.count()));
  int64_t outboundBufferBytes = readInteger(
      ini, "Hub", "outbound_buffer_bytes", int64_t(config.outboundBufferBytes));
  if (outboundBufferBytes <= 0) {
    throw runtime_error("outbound_buffer_bytes must be positive");
  }
  config.outboundBufferBytes = size_t(outboundBufferBytes);

  config.verbose = int(readInteger(ini, "Debug", "verbose", config.verbose));
  config.silent = readInteger(ini, "Debug", "silent", config.silent) != 0;
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config.maxLogSize = logsize;
  }

  if (config.port <= 0 || config.port > 65535) {
    throw runtime_error("Invalid port in " + path);
  }
  if (config.probe.attempts < 1) {
    throw runtime_error("probe_attempts must be at least 1");
  }
  if (config.probe.interval.count() <= 0) {
    throw runtime_error("probe_interval_ms must be positive");
  }
  if (config.probe.timeout.count() <= 0) {
    throw runtime_error("probe_timeout_ms must be positive");
  }
  if (config.probe.retryDelay.count() <= 0) {
    throw runtime_error("sweep_retry_delay_ms must be positive");
  }
  return config;
}
}  // namespace sb
