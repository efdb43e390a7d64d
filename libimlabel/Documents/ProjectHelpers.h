#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Documents/AnnotationKind.h>
#include <libimlabel/Documents/Project.h>

#include <array>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace iml
{
    // summary counts over a set of annotations
    struct AnnotationStatistics final {
        friend bool operator==(const AnnotationStatistics&, const AnnotationStatistics&) = default;

        size_t total = 0;
        size_t num_unlabeled = 0;
        std::array<size_t, static_cast<size_t>(AnnotationKind::NUM_OPTIONS)> num_by_kind{};
        std::map<std::string, size_t, std::less<>> num_by_label;

        size_t num_of_kind(AnnotationKind kind) const { return num_by_kind.at(static_cast<size_t>(kind)); }
    };

    AnnotationStatistics calc_statistics(std::span<const Annotation>);
    AnnotationStatistics calc_statistics(const Project&);

    // returns the ids of all annotations in the project that refer to the label
    std::vector<AnnotationID> find_annotations_by_label(const Project&, std::string_view label_name);

    // returns the ids of all annotations in the project of the given kind
    std::vector<AnnotationID> find_annotations_by_kind(const Project&, AnnotationKind);

    // returns the names of every kind that appears at least once, in `AnnotationKind` order
    std::vector<std::string> present_kind_names(std::span<const Annotation>);

    // the image file extensions that `load_image_folder` picks up (compared case-insensitively)
    inline constexpr auto c_supported_image_extensions = std::to_array<std::string_view>({
        ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tiff",
    });

    bool is_supported_image_file(const std::filesystem::path&);

    // returns a new project that contains every supported image file directly inside
    // `directory`, sorted by filename, with unknown dimensions and no labels or annotations
    //
    // a missing directory, or one without images, yields an empty project
    Project load_image_folder(const std::filesystem::path& directory);

    // returns a human-readable one-line description of the annotation, e.g.
    // "#3 Rectangle (10, 10) - (100, 100) [car]"
    std::string to_summary_string(const Annotation&);
}
