#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/Project.h>
#include <libimlabel/Formats/ApproximationPolicy.h>
#include <libimlabel/Formats/ExportMetadata.h>
#include <libimlabel/Graphics/Color.h>

#include <filesystem>
#include <iosfwd>
#include <string_view>

namespace iml
{
    // the COCO object detection/segmentation format
    //
    // images get ids from 1 in project order. Categories are the project's labels, sorted
    // by name, with ids from 1, so that repeated exports of the same project produce the
    // same ids. Each labeled annotation becomes a COCO annotation with a one-polygon
    // `segmentation`, its `area`, and its `bbox` as `[x, y, width, height]`. Unlabeled
    // annotations have no category, so they are skipped.
    class COCO final {
    public:
        // throws `UnsupportedKind` if an annotation needs an approximation that `policy` forbids
        static void write(
            std::ostream&,
            const Project&,
            const ApproximationPolicy& policy = ApproximationPolicy{},
            const ExportMetadata& = ExportMetadata{}
        );

        // returns a project that contains the images, categories (as labels, colored with
        // `label_color`) and annotations of a COCO document
        //
        // an axis-aligned 4-corner segmentation that matches its bbox is read as a rectangle,
        // any other segmentation with at least three points as a polygon, and an annotation
        // that only has a bbox as a rectangle. Throws `MalformedInput` if the document
        // cannot be read.
        static Project read(
            std::istream&,
            std::string_view source_name = {},
            const Color& label_color = c_unlabeled_annotation_color
        );
    };

    // writes a COCO document for the project to `path` atomically
    void export_coco_file(
        const std::filesystem::path& path,
        const Project&,
        const ApproximationPolicy& policy = ApproximationPolicy{},
        const ExportMetadata& = ExportMetadata{}
    );

    // reads a COCO document from `path`
    Project import_coco_file(
        const std::filesystem::path& path,
        const Color& label_color = c_unlabeled_annotation_color
    );
}
