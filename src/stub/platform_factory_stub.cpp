#include "../platform_factory.hpp"
#include "stub_providers.hpp"

namespace reap {

std::unique_ptr<IProcessDataProvider> make_process_data_provider() {
    return std::make_unique<StubProcessDataProvider>();
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<StubProcessKiller>();
}

} // namespace reap
