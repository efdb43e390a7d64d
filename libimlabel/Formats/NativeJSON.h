#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/Label.h>
#include <libimlabel/Documents/Project.h>
#include <libimlabel/Formats/ExportMetadata.h>
#include <libimlabel/Graphics/Color.h>

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace iml
{
    // the annotations of one image, as read from a per-image native JSON document
    struct ImageAnnotationSet final {
        friend bool operator==(const ImageAnnotationSet&, const ImageAnnotationSet&) = default;

        std::filesystem::path image_path;
        std::vector<Label> labels;            // in document order
        std::vector<Annotation> annotations;  // ids are invalid if the document does not record them
    };

    // the native JSON format
    //
    // a per-image document is an object with `image_path`, `image_name`, `annotations`,
    // `labels`, `label_colors`, `total_annotations`, `annotation_types` and `creation_date`.
    // Each element of `annotations` is exactly `{type, coordinates, label, color}`, where
    // `color` is the annotation's effective color. The document also carries
    // `annotation_ids` and `color_overrides` (ids of annotations whose color is explicit),
    // so that ids and overrides survive a round-trip.
    //
    // a project document ("master dataset") is an object with `dataset_info` and `images`,
    // where each element of `images` is a per-image object with the additional members
    // `relative_path`, `width` and `height`.
    //
    // `default_color` is the color of annotations that have neither an override nor a
    // label (on write), and of labels and annotations that a document lists without a
    // color (on read).
    class NativeJSON final {
    public:
        static void write_image(
            std::ostream&,
            const Project&,
            size_t image_index,
            const ExportMetadata& = ExportMetadata{},
            const Color& default_color = c_unlabeled_annotation_color
        );

        // throws `MalformedInput` if the document cannot be read
        static ImageAnnotationSet read_image(
            std::istream&,
            std::string_view source_name = {},
            const Color& default_color = c_unlabeled_annotation_color
        );

        // `project_directory` is the directory the document will be written into, which
        // is used to compute each image's `relative_path`
        static void write_project(
            std::ostream&,
            const Project&,
            const std::filesystem::path& project_directory = {},
            const ExportMetadata& = ExportMetadata{},
            const Color& default_color = c_unlabeled_annotation_color
        );

        // throws `MalformedInput` if the document cannot be read, or if its annotation
        // ids are duplicated or greater than `c_max_annotation_id`
        static Project read_project(
            std::istream&,
            std::string_view source_name = {},
            const Color& default_color = c_unlabeled_annotation_color
        );
    };

    // replaces the annotations of the given image with those in `set`, adding any of
    // the set's labels that the project doesn't already have
    //
    // annotations keep their recorded ids where those are free in the project, and are
    // otherwise given fresh ones. Either the whole set is imported, or the project is
    // left unchanged.
    void import_image_annotations(Project&, size_t image_index, const ImageAnnotationSet&);

    // returns the conventional location of an image's native JSON document, which
    // sits beside the image (e.g. `dir/cat.png` -> `dir/cat_annotations.json`)
    std::filesystem::path native_annotation_path_for(const std::filesystem::path& image_path);

    // the outcome of `load_image_annotation_files`
    struct AnnotationFilesLoadResult final {
        size_t num_loaded = 0;
        std::vector<std::filesystem::path> failed;  // files that exist but could not be read
    };

    // imports, for each image in the project, the per-image document found at
    // `native_annotation_path_for(image path)`, replacing that image's annotations
    //
    // images without a document are left as-is. A document that cannot be read is
    // logged, recorded in the result, and leaves its image unchanged.
    AnnotationFilesLoadResult load_image_annotation_files(
        Project&,
        const Color& default_color = c_unlabeled_annotation_color
    );

    // writes the project document to `path` atomically
    void save_project_file(
        const std::filesystem::path& path,
        const Project&,
        const ExportMetadata& = ExportMetadata{},
        const Color& default_color = c_unlabeled_annotation_color
    );

    // reads a project document from `path`
    Project load_project_file(
        const std::filesystem::path& path,
        const Color& default_color = c_unlabeled_annotation_color
    );

    // writes one per-image document for each image in the project into `output_directory`,
    // named as `native_annotation_path_for` would name it, and returns the written paths
    //
    // images whose stems collide (e.g. `cat.png` and `cat.jpg`) get distinct files: the
    // first, in project order, gets `cat_annotations.json` and later ones get
    // `cat_2_annotations.json`, etc. (see `UniqueFilenameAllocator`)
    //
    // all documents are rendered before any file is written
    std::vector<std::filesystem::path> export_native_annotation_files(
        const std::filesystem::path& output_directory,
        const Project&,
        const ExportMetadata& = ExportMetadata{},
        const Color& default_color = c_unlabeled_annotation_color
    );
}
