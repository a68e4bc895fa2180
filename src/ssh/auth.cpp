#include "auth.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <libssh2.h>
#include <cstring>
#include <cstdlib>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string secret;
    int prompt_round = 0;
};

// Answers every prompt with the secret. The server decides what it asks;
// a second round means the first answer was not accepted.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->secret.c_str());
        responses[i].length = static_cast<unsigned int>(data->secret.length());
    }
    data->prompt_round++;
}

static Result<void> auth_failure(SshContext& ctx, int rc, const std::string& what) {
    if (SshContext::is_transport_error(rc)) {
        return Result<void>::Err(ErrorKind::Connection,
                                 what + ": connection dropped (" + ctx.last_error() + ")");
    }
    return Result<void>::Err(ErrorKind::Authentication, what);
}

static int try_password(SshContext& ctx, const RemoteCredentials& creds) {
    return ctx.call([&]() {
        return libssh2_userauth_password(ctx.session, creds.username.c_str(), creds.secret.c_str());
    });
}

static int try_keyboard_interactive(SshContext& ctx, const RemoteCredentials& creds) {
    KbdAuthData kbd_data;
    kbd_data.secret = creds.secret;

    void** abstract = libssh2_session_abstract(ctx.session);
    *abstract = &kbd_data;
    int rc = ctx.call([&]() {
        return libssh2_userauth_keyboard_interactive(ctx.session, creds.username.c_str(), kbd_callback);
    });
    *abstract = nullptr;
    return rc;
}

static int try_public_key(SshContext& ctx, const RemoteCredentials& creds) {
    const char* passphrase = nullptr;

    if (creds.key_path) {
        if (!creds.secret.empty()) passphrase = creds.secret.c_str();
        return ctx.call([&]() {
            return libssh2_userauth_publickey_fromfile(ctx.session, creds.username.c_str(),
                                                       nullptr, creds.key_path->c_str(), passphrase);
        });
    }

    // Private key material held in memory (never written to disk)
    return ctx.call([&]() {
        return libssh2_userauth_publickey_frommemory(ctx.session,
                                                     creds.username.c_str(), creds.username.size(),
                                                     nullptr, 0,
                                                     creds.secret.data(), creds.secret.size(),
                                                     nullptr);
    });
}

Result<void> authenticate(SshContext& ctx, const RemoteCredentials& creds) {
    // Check what auth methods the server supports
    char* auth_list = static_cast<char*>(ctx.call_ptr([&]() -> void* {
        return libssh2_userauth_list(ctx.session, creds.username.c_str(),
                                     static_cast<unsigned int>(creds.username.length()));
    }));

    {
        std::lock_guard<std::mutex> lock(ctx.io_mutex);
        if (!auth_list && libssh2_userauth_authenticated(ctx.session)) {
            gateway_log("auth: server accepted 'none' authentication");
            return Result<void>::Ok();
        }
    }
    if (ctx.lost) {
        return Result<void>::Err(ErrorKind::Connection, "Connection dropped before authentication");
    }

    std::string methods = auth_list ? auth_list : "";
    gateway_log(fmt::format("auth: {}@{} methods=[{}] using {}", creds.username, creds.host,
                            methods, auth_method_name(creds.auth)));
    auto offered = [&](const char* m) {
        return methods.empty() || methods.find(m) != std::string::npos;
    };

    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;
    switch (creds.auth) {
    case AuthMethod::PublicKey:
        if (!offered("publickey")) {
            return Result<void>::Err(ErrorKind::Authentication,
                                     "Server does not accept public key authentication");
        }
        rc = try_public_key(ctx, creds);
        if (rc != 0) return auth_failure(ctx, rc, "Public key authentication failed");
        return Result<void>::Ok();

    case AuthMethod::KeyboardInteractive:
        if (offered("keyboard-interactive")) {
            rc = try_keyboard_interactive(ctx, creds);
            if (rc == 0) return Result<void>::Ok();
            if (SshContext::is_transport_error(rc)) break;
        }
        if (offered("password")) rc = try_password(ctx, creds);
        break;

    case AuthMethod::Password:
        if (offered("password")) {
            rc = try_password(ctx, creds);
            if (rc == 0) return Result<void>::Ok();
            if (SshContext::is_transport_error(rc)) break;
        }
        // Keyboard-interactive fallback (servers that only prompt)
        if (offered("keyboard-interactive")) rc = try_keyboard_interactive(ctx, creds);
        break;
    }

    if (rc == 0) return Result<void>::Ok();
    return auth_failure(ctx, rc, "Authentication failed (check username/password)");
}
