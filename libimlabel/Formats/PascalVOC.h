#pragma once

#include <libimlabel/Documents/Project.h>
#include <libimlabel/Formats/ApproximationPolicy.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <vector>

namespace iml
{
    struct PascalVOCParameters final {
        ApproximationPolicy approximation_policy;

        // written as `<size><depth>`, because images are never decoded
        int image_depth = 3;
    };

    // the Pascal VOC format, which is one `<annotation>` XML document per image
    //
    // each labeled annotation becomes an `<object>` with a `<bndbox>` (integer pixel
    // coordinates, truncated toward zero). Rectangles map onto the bounding box exactly.
    // Polygons, and points/circles (approximated according to the policy), also carry a
    // `<polygon>` of `<pt>` elements. Unlabeled annotations are skipped.
    class PascalVOC final {
    public:
        // throws `UnsupportedKind` if an annotation needs an approximation that the
        // parameters' policy forbids
        static void write(
            std::ostream&,
            const Project&,
            size_t image_index,
            const PascalVOCParameters& = PascalVOCParameters{}
        );
    };

    // writes `Annotations/<image stem>.xml` into `output_directory` for each image in the
    // project that has annotations, and returns the written paths
    //
    // images whose stems collide (e.g. `cat.png` and `cat.jpg`, or `a/cat.png` and
    // `b/cat.png`) get distinct files: the first, in project order, gets `cat.xml` and
    // later ones get `cat_2.xml`, `cat_3.xml`, etc. (see `UniqueFilenameAllocator`)
    //
    // all documents are rendered before any file is written, and each file is written
    // atomically
    std::vector<std::filesystem::path> export_pascal_voc_files(
        const std::filesystem::path& output_directory,
        const Project&,
        const PascalVOCParameters& = PascalVOCParameters{}
    );
}
