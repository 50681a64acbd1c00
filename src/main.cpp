#include "platform_factory.hpp"
#include "app.hpp"
#include <iostream>
#include <memory>

int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    try {
        // Create platform-specific providers (owned here in main)
        auto process_provider = reap::make_process_data_provider();
        auto killer = reap::make_process_killer();

        // App does not own these resources - they're managed here
        reap::App app(process_provider.get(), killer.get(), std::cin, std::cout, std::cerr);
        return app.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
