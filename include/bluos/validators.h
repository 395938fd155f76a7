#pragma once

#include <optional>
#include <string>

namespace bluos
{

static const size_t MAX_HOSTNAME_LENGTH = 253;
static const int MIN_VOLUME = 0;
static const int MAX_VOLUME = 100;

// Accepts dotted IPv4 literals outside the loopback, multicast, reserved,
// link-local and unspecified ranges.
bool validate_ip(const std::string &ip);

// Trimmed address when it validates.
std::optional<std::string> sanitize_ip(const std::string &ip);

// RFC 1035 host name without shell metacharacters.
bool validate_hostname(const std::string &hostname);

// DNS-SD service type such as "_musc._tcp".
bool validate_service_name(const std::string &service);

// Private (RFC 1918) or shared address space (RFC 6598) IPv4 literal.
bool is_local_address(const std::string &ip);

// Throws ValidationError outside MIN_VOLUME..MAX_VOLUME.
int require_volume(long volume);
int clamp_volume(long volume);

long clamp_value(long value, long min_val, long max_val);

bool is_valid_utf8(const std::string &str);

} // namespace bluos
