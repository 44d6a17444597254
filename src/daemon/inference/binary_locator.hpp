#pragma once

#include <optional>
#include <string>

namespace binaries {

// Looks for an executable `name` in `bin_dir` (if set), then on $PATH.
std::optional<std::string> find(const std::string& name, const std::string& bin_dir = {});

} // namespace binaries
