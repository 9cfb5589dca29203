#pragma once

#include <functional>
#include <string>

namespace finmda_core {

// (fraction done in [0,1], human-readable step)
using ProgressUpdater = std::function<void(float, const std::string &)>;

}  // namespace finmda_core
