#include "../platform_factory.hpp"

#include "linux_process_data_provider.hpp"
#include "linux_process_killer.hpp"

namespace reap {

std::unique_ptr<IProcessDataProvider> make_process_data_provider() {
    return std::make_unique<LinuxProcessDataProvider>();
}

std::unique_ptr<IProcessKiller> make_process_killer() {
    return std::make_unique<LinuxProcessKiller>();
}

} // namespace reap
