#pragma once

#include <core/types.hpp>

struct SshContext;

// Authenticate an established (handshaken) session with the given credentials.
//
//   Password             password, then keyboard-interactive if the server offers it
//   KeyboardInteractive  every prompt answered with the secret, then password
//   PublicKey            key file (secret = passphrase) or in-memory PEM in secret
//
// Failures: Authentication when the server refuses, Connection when the
// transport breaks mid-exchange.
Result<void> authenticate(SshContext& ctx, const RemoteCredentials& creds);
