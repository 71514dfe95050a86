#include <iostream>
#include <vector>
#include <string>
#include <nlohmann/json.hpp>
#include "platform.hpp"
#include "engine/config.hpp"

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: quire [--config=<file>] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  ping                              - Test connection\n";
        std::cerr << "  status                            - Manifest state\n";
        std::cerr << "  resolve <src> [locale] [version]  - Resolve an asset reference\n";
        std::cerr << "  exists <src> [locale] [version]   - Check an exact context\n";
        std::cerr << "  availability <src>                - Existence in every context\n";
        std::cerr << "  contexts                          - List locale/version pairs\n";
        std::cerr << "  invalidate                        - Drop the cached manifest\n";
        std::cerr << "  shutdown                          - Stop the daemon\n";
        return 1;
    }

    std::filesystem::path config_path = quire::platform::system::get_config_dir() / "config.json";
    int first = 1;
    std::string arg = argv[first];
    if (arg.rfind("--config=", 0) == 0) {
        config_path = arg.substr(9);
        ++first;
    }
    if (first >= argc) {
        std::cerr << "Error: missing command.\n";
        return 1;
    }

    auto config = quire::engine::Config::load(config_path);

    nlohmann::json request;
    request["method"] = argv[first];
    request["params"] = nlohmann::json::array();
    for (int i = first + 1; i < argc; ++i) {
        request["params"].push_back(argv[i]);
    }

    auto client = quire::platform::Client::create();
    if (!client) {
        std::cerr << "Error: Failed to create client platform interface.\n";
        return 1;
    }

    if (!client->connect(config.socket_name)) {
        std::cerr << "Error: Could not connect to quired daemon. Is it running?\n";
        return 1;
    }

    std::string response = client->send(request.dump());
    if (response.empty()) {
        std::cerr << "Error: No reply from daemon.\n";
        return 1;
    }

    try {
        auto reply = nlohmann::json::parse(response);
        if (reply.contains("error")) {
            std::cerr << "Error: " << reply["error"].get<std::string>() << "\n";
            return 1;
        }
        std::cout << reply["result"].dump(2) << "\n";
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error: Malformed reply: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
