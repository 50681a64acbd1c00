#pragma once

#include "interfaces/i_process_data_provider.hpp"
#include "interfaces/i_process_killer.hpp"
#include <memory>

namespace reap {

// Factory functions to create platform-specific providers.
// Implemented per-platform; the build picks linux/ or stub/.
std::unique_ptr<IProcessDataProvider> make_process_data_provider();
std::unique_ptr<IProcessKiller> make_process_killer();

} // namespace reap
