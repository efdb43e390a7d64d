#include "PascalVOC.h"

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/AnnotationKind.h>
#include <libimlabel/Documents/ImageEntry.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>
#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Platform/Log.h>
#include <libimlabel/Utils/Exceptions.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace iml;

namespace
{
    // writes `str` with XML's special characters escaped
    struct XMLEscaped final {
        std::string_view str;
    };

    std::ostream& operator<<(std::ostream& out, const XMLEscaped& escaped)
    {
        for (const char c : escaped.str) {
            switch (c) {
            case '&':  out << "&amp;";  break;
            case '<':  out << "&lt;";   break;
            case '>':  out << "&gt;";   break;
            case '"':  out << "&quot;"; break;
            case '\'': out << "&apos;"; break;
            default:   out << c;        break;
            }
        }
        return out;
    }

    // VOC coordinates are integer pixels: values are truncated toward zero
    int64_t to_voc_coordinate(double v)
    {
        return static_cast<int64_t>(v);
    }

    void write_header(std::ostream& out, const ImageEntry& image, const PascalVOCParameters& parameters)
    {
        const std::string folder = image.path.parent_path().filename().string();
        const std::string filename = image.path.filename().string();
        const std::string path = image.path.string();

        out << "  <folder>" << XMLEscaped{folder} << "</folder>\n";
        out << "  <filename>" << XMLEscaped{filename} << "</filename>\n";
        out << "  <path>" << XMLEscaped{path} << "</path>\n";
        out << "  <source>\n";
        out << "    <database>Unknown</database>\n";
        out << "  </source>\n";
        out << "  <size>\n";
        out << "    <width>" << (image.dimensions ? image.dimensions->width : 0) << "</width>\n";
        out << "    <height>" << (image.dimensions ? image.dimensions->height : 0) << "</height>\n";
        out << "    <depth>" << parameters.image_depth << "</depth>\n";
        out << "  </size>\n";
        out << "  <segmented>0</segmented>\n";
    }

    void write_object(std::ostream& out, const std::string& name, const ExportShape& shape, bool include_polygon)
    {
        out << "  <object>\n";
        out << "    <name>" << XMLEscaped{name} << "</name>\n";
        out << "    <pose>Unspecified</pose>\n";
        out << "    <truncated>0</truncated>\n";
        out << "    <difficult>0</difficult>\n";
        out << "    <bndbox>\n";
        out << "      <xmin>" << to_voc_coordinate(shape.bounds.left()) << "</xmin>\n";
        out << "      <ymin>" << to_voc_coordinate(shape.bounds.top()) << "</ymin>\n";
        out << "      <xmax>" << to_voc_coordinate(shape.bounds.right()) << "</xmax>\n";
        out << "      <ymax>" << to_voc_coordinate(shape.bounds.bottom()) << "</ymax>\n";
        out << "    </bndbox>\n";
        if (include_polygon) {
            out << "    <polygon>\n";
            for (const Vec2& p : shape.outline) {
                out << "      <pt>\n";
                out << "        <x>" << to_voc_coordinate(p.x) << "</x>\n";
                out << "        <y>" << to_voc_coordinate(p.y) << "</y>\n";
                out << "      </pt>\n";
            }
            out << "    </polygon>\n";
        }
        out << "  </object>\n";
    }
}

void iml::PascalVOC::write(
    std::ostream& out,
    const Project& project,
    size_t image_index,
    const PascalVOCParameters& parameters)
{
    const ImageEntry& image = project.image_at(image_index);

    out << R"(<?xml version="1.0" encoding="utf-8"?>)";
    out << '\n';
    out << "<annotation>\n";
    write_header(out, image, parameters);

    size_t num_approximated = 0;

    for (size_t i = 0; i < image.annotations.size(); ++i) {
        const Annotation& annotation = image.annotations[i];
        if (not annotation.label) {
            log_debug("%s: skipping unlabeled annotation %s: Pascal VOC objects require a name", image.path.string().c_str(), std::to_string(annotation.id.get()).c_str());
            continue;
        }

        const CodecErrorLocation location{
            .source = image.path.string(),
            .byte_offset = std::nullopt,
            .image_index = image_index,
            .annotation_index = i,
        };
        const ExportShape shape = to_export_shape(annotation.geometry, parameters.approximation_policy, location);
        if (shape.is_approximation) {
            ++num_approximated;
        }
        write_object(out, *annotation.label, shape, shape.is_approximation or kind_of(annotation) == AnnotationKind::Polygon);
    }

    out << "</annotation>\n";

    if (num_approximated > 0) {
        log_debug("%s: %zu annotation(s) were approximated as polygons", image.path.string().c_str(), num_approximated);
    }
}

std::vector<std::filesystem::path> iml::export_pascal_voc_files(
    const std::filesystem::path& output_directory,
    const Project& project,
    const PascalVOCParameters& parameters)
{
    const std::filesystem::path annotations_directory = output_directory / "Annotations";

    // render everything before touching the filesystem
    std::vector<std::pair<std::filesystem::path, std::string>> documents;
    UniqueFilenameAllocator filenames{annotations_directory};
    size_t num_skipped = 0;
    for (size_t i = 0; i < project.num_images(); ++i) {
        const ImageEntry& image = project.image_at(i);
        if (image.annotations.empty()) {
            ++num_skipped;
            continue;
        }
        std::stringstream ss;
        PascalVOC::write(ss, project, i, parameters);

        const std::string stem = image.path.stem().string();
        std::filesystem::path destination = filenames.claim(stem, ".xml");
        if (destination.filename() != stem + ".xml") {
            log_warn("%s: another image already exports to %s.xml: writing %s instead", image.path.string().c_str(), stem.c_str(), destination.filename().string().c_str());
        }
        documents.emplace_back(std::move(destination), std::move(ss).str());
    }

    std::filesystem::create_directories(annotations_directory);

    std::vector<std::filesystem::path> rv;
    rv.reserve(documents.size());
    for (const auto& [path, content] : documents) {
        write_file_atomically(path, content);
        rv.push_back(path);
    }
    log_info("%s: exported %zu Pascal VOC document(s) (%zu image(s) without annotations skipped)", annotations_directory.string().c_str(), rv.size(), num_skipped);
    return rv;
}
