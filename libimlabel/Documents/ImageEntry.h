#pragma once

#include <libimlabel/Documents/Annotation.h>

#include <filesystem>
#include <optional>
#include <vector>

namespace iml
{
    // the pixel dimensions of an image
    struct ImageDimensions final {
        friend bool operator==(const ImageDimensions&, const ImageDimensions&) = default;

        int width = 0;
        int height = 0;
    };

    // one image in a project, which owns its annotations in z-order (the last
    // annotation is drawn on top)
    struct ImageEntry final {
        friend bool operator==(const ImageEntry&, const ImageEntry&) = default;

        std::filesystem::path path;
        std::optional<ImageDimensions> dimensions;
        std::vector<Annotation> annotations;
    };
}
