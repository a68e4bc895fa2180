#include "serve.hpp"
#include "http_server.hpp"
#include <managers/session_gateway.hpp>
#include <core/config.hpp>
#include <core/credentials.hpp>
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <iostream>
#include <iterator>

int run_serve(int port, const std::string& bind) {
    Config config;
    auto loaded = Config::load();
    if (loaded.is_ok()) {
        config = loaded.value;
    } else {
        std::cerr << "vpsx serve: config ignored: " << loaded.error << "\n";
    }

    // The controller hands credentials over on stdin; never on argv or disk
    std::string payload;
    if (!platform::stdin_is_tty()) {
        payload.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    SessionGateway gateway(config);
    if (!payload.empty()) {
        auto creds = decode_credentials(payload);
        payload.assign(payload.size(), '\0');
        if (creds.is_err()) {
            std::cerr << "vpsx serve: " << creds.error << "\n";
            return 2;
        }
        auto connected = gateway.connect(creds.value);
        creds.value.secret.assign(creds.value.secret.size(), '\0');
        if (connected.is_err()) {
            // Serve anyway: session endpoints report the failure
            std::cerr << "vpsx serve: connect failed: " << connected.error << "\n";
            gateway_log_error("serve: connect", connected);
        }
    }

    HttpServer server(gateway, bind, port);
    auto opened = server.open();
    if (opened.is_err()) {
        std::cerr << "vpsx serve: " << opened.error << "\n";
        return 1;
    }

    std::cerr << fmt::format("vpsx serve: listening on {}:{}\n", bind, server.port());
    server.stop_on_signals();
    server.run();
    gateway.shutdown();
    return 0;
}
