#pragma once

#include <string>

namespace iml
{
    // parameters for constructing a `TemporaryDirectory`
    //
    // designed for designated initializer compatibility:
    //
    //     `TemporaryDirectory dir({ .prefix = "voc_export_" });`
    struct TemporaryDirectoryParameters final {
        std::string prefix{};
        std::string suffix{};
    };
}
