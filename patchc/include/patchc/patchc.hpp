#pragma once

#include <string_view>
#include "compiler.hpp"
#include "diagnostics.hpp"
#include "opcode.hpp"
#include "patch.hpp"
#include "patch_json.hpp"

namespace patchc {

/// patchc version information
struct Version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static constexpr std::string_view string() { return "0.1.0"; }
};

} // namespace patchc
