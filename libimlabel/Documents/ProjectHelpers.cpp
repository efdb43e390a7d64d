#include "ProjectHelpers.h"

#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Platform/Log.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>
#include <string>
#include <utility>

using namespace iml;

namespace
{
    void accumulate_into(AnnotationStatistics& stats, std::span<const Annotation> annotations)
    {
        for (const Annotation& annotation : annotations) {
            ++stats.total;
            ++stats.num_by_kind.at(static_cast<size_t>(kind_of(annotation)));
            if (annotation.label) {
                ++stats.num_by_label[*annotation.label];
            }
            else {
                ++stats.num_unlabeled;
            }
        }
    }

    template<typename Predicate>
    std::vector<AnnotationID> find_annotations_where(const Project& project, Predicate predicate)
    {
        std::vector<AnnotationID> rv;
        for (const ImageEntry& image : project.images()) {
            for (const Annotation& annotation : image.annotations) {
                if (predicate(annotation)) {
                    rv.push_back(annotation.id);
                }
            }
        }
        return rv;
    }
}

AnnotationStatistics iml::calc_statistics(std::span<const Annotation> annotations)
{
    AnnotationStatistics rv;
    accumulate_into(rv, annotations);
    return rv;
}

AnnotationStatistics iml::calc_statistics(const Project& project)
{
    AnnotationStatistics rv;
    for (const ImageEntry& image : project.images()) {
        accumulate_into(rv, image.annotations);
    }
    return rv;
}

std::vector<AnnotationID> iml::find_annotations_by_label(const Project& project, std::string_view label_name)
{
    return find_annotations_where(project, [label_name](const Annotation& annotation)
    {
        return annotation.label and *annotation.label == label_name;
    });
}

std::vector<AnnotationID> iml::find_annotations_by_kind(const Project& project, AnnotationKind kind)
{
    return find_annotations_where(project, [kind](const Annotation& annotation)
    {
        return kind_of(annotation) == kind;
    });
}

std::vector<std::string> iml::present_kind_names(std::span<const Annotation> annotations)
{
    const AnnotationStatistics stats = calc_statistics(annotations);
    std::vector<std::string> rv;
    for (size_t i = 0; i < stats.num_by_kind.size(); ++i) {
        if (stats.num_by_kind[i] > 0) {
            rv.emplace_back(to_string_view(static_cast<AnnotationKind>(i)));
        }
    }
    return rv;
}

std::string iml::to_summary_string(const Annotation& annotation)
{
    std::stringstream ss;
    ss << '#' << annotation.id << ' ' << to_summary_string(annotation.geometry);
    if (annotation.label) {
        ss << " [" << *annotation.label << ']';
    }
    return std::move(ss).str();
}

bool iml::is_supported_image_file(const std::filesystem::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return std::find(c_supported_image_extensions.begin(), c_supported_image_extensions.end(), extension) != c_supported_image_extensions.end();
}

Project iml::load_image_folder(const std::filesystem::path& directory)
{
    Project rv;
    for (std::filesystem::path& image_path : find_files_with_extensions(directory, c_supported_image_extensions)) {
        rv.add_image(std::move(image_path));
    }

    if (rv.num_images() == 0) {
        log_warn("%s: no supported image files found", directory.string().c_str());
    }
    else {
        log_info("%s: loaded %zu image(s)", directory.string().c_str(), rv.num_images());
    }
    return rv;
}
