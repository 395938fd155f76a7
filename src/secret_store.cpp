#include "bluos/secret_store.h"

#include "bluos/errors.h"
#include "log.h"
#include "string_util.h"

#include <cstdlib>

namespace bluos
{

static bool safe_argument(const std::string &s)
{
  static const std::string unsafe(";&|`$()<>\n\r ");
  return !s.empty() && s.find_first_of(unsafe) == std::string::npos;
}

std::string mask_secret(const std::string &secret)
{
  if (secret.size() <= 12)
    return "***";
  return secret.substr(0, 8) + "..." + secret.substr(secret.size() - 4);
}

std::string EnvironmentSecretStore::variable_name(const std::string &name)
{
  std::string var = "BLUOS_" + to_upper(name);
  for (auto &c : var)
  {
    if (c == '-' || c == '.')
      c = '_';
  }
  return var;
}

std::string EnvironmentSecretStore::resolve(const std::string &name)
{
  const char *value = std::getenv(variable_name(name).c_str());
  return value ? trim(value) : std::string();
}

bool keychain_available()
{
#ifdef __APPLE__
  return true;
#else
  return false;
#endif
}

// `security` exit status for an entry that does not exist.
static const int KEYCHAIN_ITEM_NOT_FOUND = 44;

bool KeychainSecretStore::usable(const std::string &name) const
{
  if (!available_)
  {
    LOG("Keychain is only available on macOS, skipping " << (safe_argument(name) ? name : "secret"));
    return false;
  }
  if (!safe_argument(service_) || !safe_argument(name))
  {
    LOG_WARN("Keychain service or account name contains unsafe characters");
    return false;
  }
  return true;
}

std::string KeychainSecretStore::resolve(const std::string &name)
{
  if (!usable(name))
    return std::string();

  try
  {
    ProcessResult result = runner_.run({"security", "find-generic-password", "-s", service_, "-a", name, "-w"},
                                       std::chrono::seconds(5));
    if (result.exit_status == 0)
      return trim(result.output);
    LOG("Secret " << name << " not found in keychain");
  }
  catch (const Error &e)
  {
    LOG("Keychain unavailable: " << e.what());
  }
  return std::string();
}

bool KeychainSecretStore::store(const std::string &name, const std::string &value)
{
  if (!usable(name))
    return false;
  if (trim(value).empty() || value.find('\0') != std::string::npos)
  {
    LOG_ERROR("Refusing to store an empty or binary secret");
    return false;
  }

  try
  {
    ProcessResult result = runner_.run(
        {"security", "add-generic-password", "-s", service_, "-a", name, "-w", value, "-U"},
        std::chrono::seconds(5));
    if (result.exit_status == 0)
    {
      LOG("Stored " << name << " in keychain");
      return true;
    }
    LOG_ERROR("Failed to store " << name << " in keychain, security exited with " << result.exit_status);
  }
  catch (const Error &e)
  {
    LOG_ERROR("Keychain unavailable: " << e.what());
  }
  return false;
}

bool KeychainSecretStore::remove(const std::string &name)
{
  if (!usable(name))
    return false;

  try
  {
    ProcessResult result =
        runner_.run({"security", "delete-generic-password", "-s", service_, "-a", name}, std::chrono::seconds(5));
    if (result.exit_status == 0 || result.exit_status == KEYCHAIN_ITEM_NOT_FOUND)
    {
      LOG("Removed " << name << " from keychain");
      return true;
    }
    LOG_ERROR("Failed to remove " << name << " from keychain, security exited with " << result.exit_status);
  }
  catch (const Error &e)
  {
    LOG_ERROR("Keychain unavailable: " << e.what());
  }
  return false;
}

std::string ChainedSecretStore::resolve(const std::string &name)
{
  for (auto &store : stores_)
  {
    std::string value = store->resolve(name);
    if (!value.empty())
      return value;
  }
  return std::string();
}

} // namespace bluos
