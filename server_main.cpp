#include <cstdlib>
#include <iostream>
#include <memory>

#include "access_gate.hpp"
#include "config.hpp"
#include "gateway_server.hpp"
#include "key_registry.hpp"
#include "memory_api.hpp"
#include "memory_store.hpp"

using namespace memkeep;

int main(int argc, char **argv) {
    const auto args = parseArgs(argc, argv);
    const auto config = loadServerConfig(args);

    std::shared_ptr<MemoryStore> store;
    try {
        store = std::make_shared<MemoryStore>(config.memoryDir);
    } catch (const std::exception &e) {
        std::cerr << "[Bootstrap] cannot use memory dir " << config.memoryDir.string() << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::shared_ptr<const KeyRegistry> registry = std::make_shared<KeyRegistry>(KeyRegistry::load(config.whitelistPath));
    std::cout << "[Bootstrap] loaded " << registry->size() << " key(s) from " << config.whitelistPath.string() << std::endl;

    auto gate = std::make_shared<AccessGate>(registry);
    auto api = std::make_shared<MemoryApi>(gate, store);
    GatewayServer gateway(api, config);
    gateway.setupRoutes();
    gateway.listen();
    return EXIT_SUCCESS;
}
