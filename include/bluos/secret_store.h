#pragma once

#include "bluos/process_runner.h"

#include <memory>
#include <string>
#include <vector>

namespace bluos
{

static const char *const UNIFI_API_KEY_SECRET = "unifi-api-key";

// First 8 and last 4 characters of a secret longer than 12, "***" otherwise.
std::string mask_secret(const std::string &secret);

// Looks up a named secret. An empty string means unavailable; lookups never
// throw.
class SecretStore
{
public:
  virtual ~SecretStore() = default;

  virtual std::string resolve(const std::string &name) = 0;
};

// BLUOS_<NAME> from the environment, upper-cased with '-' mapped to '_'.
// "unifi-api-key" reads BLUOS_UNIFI_API_KEY.
class EnvironmentSecretStore : public SecretStore
{
public:
  std::string resolve(const std::string &name) override;

  static std::string variable_name(const std::string &name);
};

// True where the `security` tool manages a login keychain (macOS).
bool keychain_available();

// macOS login keychain through the `security` tool. Where no keychain is
// available every lookup is empty and every change fails without running
// anything.
class KeychainSecretStore : public SecretStore
{
public:
  explicit KeychainSecretStore(ProcessRunner &runner, bool available = keychain_available(),
                               std::string service = "bluos-control")
      : runner_(runner), available_(available), service_(std::move(service)) {}

  std::string resolve(const std::string &name) override;

  // Adds or replaces the entry. False with a logged reason on failure.
  bool store(const std::string &name, const std::string &value);
  // True when the entry is gone afterwards, including when it never existed.
  bool remove(const std::string &name);

  bool available() const { return available_; }

private:
  bool usable(const std::string &name) const;

  ProcessRunner &runner_;
  bool available_;
  std::string service_;
};

// First non-empty answer wins.
class ChainedSecretStore : public SecretStore
{
public:
  void add(std::unique_ptr<SecretStore> store) { stores_.push_back(std::move(store)); }

  std::string resolve(const std::string &name) override;

private:
  std::vector<std::unique_ptr<SecretStore>> stores_;
};

} // namespace bluos
