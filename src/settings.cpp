#include "bluos/settings.h"

#include "bluos/validators.h"
#include "file_util.h"
#include "log.h"
#include "string_util.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace bluos
{

std::string default_config_dir()
{
  const char *xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg)
    return std::string(xdg) + "/bluos-control";
  const char *home = std::getenv("HOME");
  return std::string(home && *home ? home : ".") + "/.config/bluos-control";
}

std::string default_config_path()
{
  return default_config_dir() + "/config.json";
}

std::string default_cache_path()
{
  return default_config_dir() + "/cache/discovery.json";
}

std::string default_unifi_cache_path()
{
  return default_config_dir() + "/cache/unifi.json";
}

Settings default_settings()
{
  Settings s;
  s.cache_path = default_cache_path();
  s.unifi.cache_path = default_unifi_cache_path();
  s.unifi.cache_ttl = s.cache_ttl;
  return s;
}

namespace
{

// Config files written by hand carry numbers as strings; accept both.
bool scalar_text(const json &value, std::string &out)
{
  if (value.is_string())
    out = value.get<std::string>();
  else if (value.is_boolean())
    out = value.get<bool>() ? "true" : "false";
  else if (value.is_number_integer())
    out = std::to_string(value.get<long long>());
  else if (value.is_number())
    out = std::to_string(static_cast<long long>(value.get<double>()));
  else
    return false;
  out = trim(out);
  return true;
}

bool number_in(const std::string &key, const std::string &text, long min_val, long max_val, long &out)
{
  long value = 0;
  if (!parse_long(text, value))
  {
    LOG_WARN("Invalid " << key << ": " << text << ", using default");
    return false;
  }
  out = clamp_value(value, min_val, max_val);
  if (out != value)
    LOG_WARN(key << " " << value << " clamped to " << out);
  return true;
}

void apply(Settings &s, const std::string &key, const std::string &text)
{
  long n = 0;

  if (key == "BLUOS_SERVICE")
  {
    if (validate_service_name(text))
      s.service_type = text;
    else
      LOG_WARN("Invalid BLUOS_SERVICE: " << text << ", using default");
  }
  else if (key == "DISCOVERY_METHOD")
  {
    if (!parse_discovery_method(text, s.discovery_method))
    {
      LOG_WARN("Invalid DISCOVERY_METHOD: " << text << ", using 'mdns'");
      s.discovery_method = DiscoveryMethod::Mdns;
    }
  }
  else if (key == "DISCOVERY_TIMEOUT")
  {
    long value = 0;
    if (parse_long(text, value) && value < 1)
      LOG_WARN("Invalid DISCOVERY_TIMEOUT: " << text << ", using default");
    else if (number_in(key, text, 1, 60, n))
      s.discovery_timeout = std::chrono::seconds(n);
  }
  else if (key == "CACHE_TTL")
  {
    if (number_in(key, text, 0, 3600, n))
      s.cache_ttl = std::chrono::seconds(n);
  }
  else if (key == "DEFAULT_SAFE_VOL")
  {
    if (number_in(key, text, MIN_VOLUME, MAX_VOLUME, n))
      s.safe_volume = static_cast<int>(n);
  }
  else if (key == "RATE_LIMIT_MS")
  {
    if (number_in(key, text, 0, 10000, n))
      s.rate_limit_interval = std::chrono::milliseconds(n);
  }
  else if (key == "MAX_RETRIES")
  {
    if (number_in(key, text, 1, 10, n))
      s.retry.max_attempts = static_cast<int>(n);
  }
  else if (key == "RETRY_BASE_DELAY_MS")
  {
    if (number_in(key, text, 0, 60000, n))
      s.retry.base_delay = std::chrono::milliseconds(n);
  }
  else if (key == "RETRY_MAX_DELAY_MS")
  {
    if (number_in(key, text, 0, 60000, n))
      s.retry.max_delay = std::chrono::milliseconds(n);
  }
  else if (key == "STATUS_TIMEOUT_MS")
  {
    if (number_in(key, text, 100, 60000, n))
      s.status_timeout = std::chrono::milliseconds(n);
  }
  else if (key == "COMMAND_TIMEOUT_MS")
  {
    if (number_in(key, text, 100, 60000, n))
      s.command_timeout = std::chrono::milliseconds(n);
  }
  else if (key == "DISCOVERY_WORKERS")
  {
    if (number_in(key, text, 1, 64, n))
      s.discovery_workers = static_cast<size_t>(n);
  }
  else if (key == "COMMAND_WORKERS")
  {
    if (number_in(key, text, 1, 64, n))
      s.command_workers = static_cast<size_t>(n);
  }
  else if (key == "BREAKER_THRESHOLD")
  {
    if (number_in(key, text, 0, 100, n))
      s.breaker_threshold = static_cast<int>(n);
  }
  else if (key == "BREAKER_COOLDOWN")
  {
    if (number_in(key, text, 1, 3600, n))
      s.breaker_cooldown = std::chrono::seconds(n);
  }
  else if (key == "CACHE_FILE")
  {
    if (!text.empty())
      s.cache_path = text;
  }
  else if (key == "UNIFI_ENABLED")
  {
    std::string v = to_lower(text);
    if (v == "true" || v == "1" || v == "yes")
      s.unifi.enabled = true;
    else if (v == "false" || v == "0" || v == "no")
      s.unifi.enabled = false;
    else
      LOG_WARN("Invalid UNIFI_ENABLED: " << text << ", using default");
  }
  else if (key == "UNIFI_CONTROLLER")
  {
    std::string host = text.substr(0, text.find(':'));
    if (text.empty() || validate_hostname(host) || validate_ip(host))
      s.unifi.controller = text;
    else
      LOG_WARN("Invalid UNIFI_CONTROLLER: " << text << ", ignoring");
  }
  else if (key == "UNIFI_SITE")
  {
    if (validate_service_name(text))
      s.unifi.site = text;
    else
      LOG_WARN("Invalid UNIFI_SITE: " << text << ", using default");
  }
  else if (key == "UNIFI_API_KEY")
  {
    s.unifi.api_key = text;
  }
  else
  {
    LOG("Ignoring unknown setting " << key);
  }
}

} // namespace

Settings parse_settings(const std::string &json_text)
{
  Settings s = default_settings();

  json doc;
  try
  {
    doc = json::parse(json_text);
  }
  catch (const json::exception &e)
  {
    LOG_ERROR("Configuration parse error: " << e.what());
    return s;
  }

  if (!doc.is_object())
  {
    LOG_ERROR("Configuration is not a JSON object, using defaults");
    return s;
  }

  for (auto it = doc.begin(); it != doc.end(); ++it)
  {
    std::string text;
    if (!scalar_text(it.value(), text))
    {
      LOG_WARN("Invalid value for " << it.key() << ", using default");
      continue;
    }
    apply(s, to_upper(it.key()), text);
  }

  if (s.retry.max_delay < s.retry.base_delay)
    s.retry.max_delay = s.retry.base_delay;
  s.unifi.cache_ttl = s.cache_ttl;
  return s;
}

std::string settings_to_json(const Settings &s)
{
  json doc{{"BLUOS_SERVICE", s.service_type},
           {"DISCOVERY_METHOD", discovery_method_name(s.discovery_method)},
           {"DISCOVERY_TIMEOUT", std::to_string(s.discovery_timeout.count())},
           {"CACHE_TTL", std::to_string(s.cache_ttl.count())},
           {"DEFAULT_SAFE_VOL", std::to_string(s.safe_volume)},
           {"UNIFI_ENABLED", s.unifi.enabled ? "true" : "false"},
           {"UNIFI_CONTROLLER", s.unifi.controller},
           {"UNIFI_API_KEY", s.unifi.api_key},
           {"UNIFI_SITE", s.unifi.site}};
  return doc.dump(2) + "\n";
}

Settings load_settings(const std::string &path)
{
  std::ifstream in(path);
  if (!in)
  {
    Settings defaults = default_settings();
    std::string error;
    if (write_private_file(path, settings_to_json(defaults), error))
      LOG("Created default configuration " << path);
    else
      LOG_ERROR("Failed to create default config: " << error);
    return defaults;
  }

  std::ostringstream content;
  content << in.rdbuf();
  return parse_settings(content.str());
}

} // namespace bluos
