#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <curl/curl.h>

#include "automation.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "key_registry.hpp"
#include "memory_client.hpp"

using namespace memkeep;

int main(int argc, char **argv) {
    const auto args = parseArgs(argc, argv);
    const auto config = loadWorkerConfig(args);

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[Bootstrap] curl_global_init failed" << std::endl;
        return EXIT_FAILURE;
    }

    auto client = std::make_shared<HttpMemoryClient>(config.apiBase, config.requestTimeoutMs);
    auto handlers = createDefaultHandlers();
    const auto whitelist = config.whitelistPath;
    AutomationDispatcher dispatcher(
        [whitelist]() { return KeyRegistry::load(whitelist); },
        config.categories,
        std::chrono::seconds(config.pollIntervalSec),
        client,
        handlers);

    std::cout << "[Bootstrap] memkeep automation worker is live" << std::endl;
    std::cout << "[Bootstrap] api: " << config.apiBase << " whitelist: " << whitelist.string()
              << " handlers: " << handlers->listHandlers().dump() << std::endl;

    int rc = EXIT_SUCCESS;
    if (config.once) {
        try {
            auto stats = dispatcher.runCycle();
            std::cout << "[Bootstrap] cycle: " << stats.toJson().dump() << std::endl;
            if (stats.failures > 0) rc = EXIT_FAILURE;
        } catch (const std::exception &e) {
            std::cerr << "[Bootstrap] cycle failed: " << e.what() << std::endl;
            rc = EXIT_FAILURE;
        }
    } else {
        dispatcher.runForever();
    }

    curl_global_cleanup();
    return rc;
}
