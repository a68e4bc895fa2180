#pragma once

#include <string>
#include "types.hpp"
#include "config.hpp"

// Start a RemoteCredentials value from the configured defaults (no secret).
RemoteCredentials credentials_from_defaults(const ConnectionDefaults& defaults);

// Reject incomplete credentials before any network activity.
Result<void> validate_credentials(const RemoteCredentials& creds);

// YAML hand-off used to pass an active session's credentials to the embedded
// server on its stdin. Never written to disk.
std::string encode_credentials(const RemoteCredentials& creds);
Result<RemoteCredentials> decode_credentials(const std::string& yaml_text);

// Parse "[user@]host[:port]" into creds (fields absent from the string are kept).
Result<void> apply_target_spec(const std::string& spec, RemoteCredentials& creds);
