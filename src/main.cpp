#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <string>

#include "platform.hpp"
#include "engine/config.hpp"
#include "engine/manifest.hpp"
#include "engine/resolver.hpp"
#include "engine/service.hpp"

// Global stop signal
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    std::cout << "\n[Quired] Interrupt signal (" << signum << ") received. Shutting down...\n";
    g_running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    std::cout << "[Quired] Starting resolver daemon (v0.1.0)...\n";

    std::filesystem::path config_path = quire::platform::system::get_config_dir() / "config.json";
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--config=", 0) == 0) config_path = arg.substr(9);
    }
    std::cout << "[Quired] Config path: " << config_path << "\n";

    auto config = quire::engine::Config::load(config_path);

    if (quire::platform::system::is_daemon_running(config.socket_name)) {
        std::cerr << "[Quired] Another daemon is already listening on " << config.socket_name << "\n";
        return 1;
    }

    quire::engine::ManifestCache cache(config.manifest_path());
    std::cout << "[Quired] Manifest path: " << cache.manifest_path() << "\n";

    quire::engine::ResolverOptions resolver_options;
    resolver_options.default_locale = config.default_locale;
    resolver_options.locales = config.locales;
    resolver_options.default_version = config.default_version;
    resolver_options.public_root = config.public_root;

    quire::engine::ResolverService service(cache, quire::engine::ContextResolver(resolver_options));

    if (auto manifest = cache.get()) {
        std::cout << "[Quired] Loaded " << manifest->assets.size() << " assets across "
                  << manifest->locales.size() << " locales.\n";
    }

    auto sentry = quire::platform::Sentry::create();
    auto bridge = quire::platform::Bridge::create();
    if (!sentry || !bridge) return 1;

    bridge->set_handler([&](const std::string& request) -> std::string {
        std::string reply = service.handle(request);
        if (service.shutdown_requested()) g_running = false;
        return reply;
    });

    const auto manifest_name = cache.manifest_path().filename();
    sentry->set_callback([&](const quire::platform::FileEvent& event) {
        if (event.path.filename() != manifest_name) return;
        if (event.type == quire::platform::FileEvent::Type::MovedOut) return;
        std::cout << "[Sentry] Manifest changed, invalidating cache.\n";
        cache.invalidate();
    });

    const auto watch_dir = cache.manifest_path().parent_path();
    if (!sentry->add_watch(watch_dir.empty() ? std::filesystem::path(".") : watch_dir)) {
        std::cerr << "[Quired] Warning: not watching " << watch_dir
                  << "; use 'quire invalidate' after publishing.\n";
    }

    if (!bridge->listen(config.socket_name)) {
        std::cerr << "[Quired] Failed to open socket " << config.socket_name << "\n";
        return 1;
    }
    std::cout << "[Quired] Ready.\n";

    std::thread bridge_thread([&bridge]() { bridge->run(); });
    std::thread sentry_thread([&sentry]() { sentry->start(); });

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(100));

    sentry->stop();
    bridge->stop();
    if (bridge_thread.joinable()) bridge_thread.join();
    if (sentry_thread.joinable()) sentry_thread.join();

    return 0;
}
