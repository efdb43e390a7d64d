#include "COCO.h"

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/ImageEntry.h>
#include <libimlabel/Documents/Label.h>
#include <libimlabel/Formats/JSONHelpers.h>
#include <libimlabel/Maths/GeometryFunctions.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>
#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Platform/Log.h>
#include <libimlabel/Utils/Exceptions.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace iml;
using json = nlohmann::ordered_json;

namespace
{
    constexpr double c_corner_match_epsilon = 1e-6;

    // returns the project's label names, sorted by name, which is the order that
    // category ids are assigned in
    std::vector<std::string> sorted_label_names_of(const Project& project)
    {
        std::vector<std::string> rv;
        rv.reserve(project.labels().size());
        for (const Label& label : project.labels()) {
            rv.push_back(label.name);
        }
        std::sort(rv.begin(), rv.end());
        return rv;
    }

    json to_json_numbers(std::initializer_list<double> values)
    {
        json rv = json::array();
        for (double v : values) {
            rv.push_back(to_json_number(v));
        }
        return rv;
    }

    json to_flat_json_coordinates(const std::vector<Vec2>& points)
    {
        json rv = json::array();
        for (const Vec2& p : points) {
            rv.push_back(to_json_number(p.x));
            rv.push_back(to_json_number(p.y));
        }
        return rv;
    }

    json info_of(const ExportMetadata& metadata)
    {
        json rv = json::object();
        rv["year"] = metadata.creation_time.tm_year + 1900;
        rv["version"] = "1.0";
        rv["description"] = "Exported from " + metadata.authoring_tool;
        rv["contributor"] = metadata.authoring_tool;
        rv["date_created"] = to_iso8601_string(metadata.creation_time);
        return rv;
    }

    json licenses()
    {
        json license = json::object();
        license["id"] = 1;
        license["name"] = "Unknown";
        license["url"] = "";

        json rv = json::array();
        rv.push_back(std::move(license));
        return rv;
    }

    bool nearly_equal(double a, double b)
    {
        return std::abs(a - b) <= c_corner_match_epsilon * std::max({1.0, std::abs(a), std::abs(b)});
    }

    bool nearly_equal(const Vec2& a, const Vec2& b)
    {
        return nearly_equal(a.x, b.x) and nearly_equal(a.y, b.y);
    }

    // returns the rectangle that `points` outline, if they are the four distinct corners of
    // an axis-aligned rectangle, visited in order around its edge
    std::optional<Rect> try_read_as_rectangle(const std::vector<Vec2>& points)
    {
        if (points.size() != c_num_rect_corners) {
            return std::nullopt;
        }
        const std::optional<Rect> bounds = bounding_rect_of(std::span<const Vec2>{points});
        if (not bounds or bounds->width() <= 0.0 or bounds->height() <= 0.0) {
            return std::nullopt;
        }

        std::array<bool, c_num_rect_corners> used{};
        for (const Vec2& p : points) {
            bool matched = false;
            for (size_t corner = 0; corner < c_num_rect_corners; ++corner) {
                if (not used[corner] and nearly_equal(p, bounds->corner(corner))) {
                    used[corner] = true;
                    matched = true;
                    break;
                }
            }
            if (not matched) {
                return std::nullopt;
            }
        }

        // consecutive points must share an edge (rules out a "bowtie" ordering)
        for (size_t i = 0; i < points.size(); ++i) {
            const Vec2& a = points[i];
            const Vec2& b = points[(i+1) % points.size()];
            if (not nearly_equal(a.x, b.x) and not nearly_equal(a.y, b.y)) {
                return std::nullopt;
            }
        }
        return bounds;
    }

    std::optional<int64_t> try_get_integer(const json& object, const char* key)
    {
        const auto it = object.find(key);
        if (it == object.end() or not it->is_number_integer()) {
            return std::nullopt;
        }
        return it->get<int64_t>();
    }

    const json& require_array(const json& document, std::string_view key, const CodecErrorLocation& location)
    {
        const json& rv = require_member(document, key, location);
        if (not rv.is_array()) {
            throw MalformedInput{location, std::string{key} + ": expected an array"};
        }
        return rv;
    }

    // returns the geometry of one COCO annotation object
    AnnotationGeometry read_geometry(const json& annotation, const CodecErrorLocation& location)
    {
        std::optional<Rect> bbox;
        if (const auto it = annotation.find("bbox"); it != annotation.end()) {
            const std::vector<double> values = to_number_vector(*it, "bbox", location);
            if (values.size() != 4) {
                throw MalformedInput{location, "bbox: expected [x, y, width, height]"};
            }
            bbox = Rect::from_corners({values[0], values[1]}, {values[0] + values[2], values[1] + values[3]});
        }

        // only polygon segmentations are read: run-length encoded ones (crowds) fall back to the bbox
        std::vector<Vec2> outline;
        if (const auto it = annotation.find("segmentation"); it != annotation.end() and it->is_array() and not it->empty()) {
            const std::vector<double> values = to_number_vector(it->front(), "segmentation", location);
            if (values.size() % 2 != 0) {
                throw MalformedInput{location, "segmentation: expected an even number of coordinates"};
            }
            for (size_t i = 0; i < values.size(); i += 2) {
                outline.push_back({values[i], values[i+1]});
            }
        }

        AnnotationGeometry rv;
        if (const auto rect = try_read_as_rectangle(outline); rect and (not bbox or (nearly_equal(rect->p1(), bbox->p1()) and nearly_equal(rect->p2(), bbox->p2())))) {
            rv = *rect;
        }
        else if (outline.size() >= 3) {
            rv = Polygon{std::move(outline)};
        }
        else if (bbox) {
            rv = *bbox;
        }
        else {
            throw MalformedInput{location, "annotation has neither a usable segmentation nor a bbox"};
        }

        try {
            validate(rv);
        }
        catch (const InvalidGeometry& ex) {
            throw MalformedInput{location, ex.what()};
        }
        return rv;
    }
}

void iml::COCO::write(
    std::ostream& out,
    const Project& project,
    const ApproximationPolicy& policy,
    const ExportMetadata& metadata)
{
    const std::vector<std::string> category_names = sorted_label_names_of(project);
    const auto category_id_of = [&category_names](const std::string& name)
    {
        const auto it = std::lower_bound(category_names.begin(), category_names.end(), name);
        return static_cast<int64_t>(std::distance(category_names.begin(), it)) + 1;
    };

    json images = json::array();
    json annotations = json::array();
    int64_t next_coco_annotation_id = 1;
    size_t num_skipped = 0;
    size_t num_approximated = 0;

    for (size_t image_index = 0; image_index < project.num_images(); ++image_index) {
        const ImageEntry& image = project.image_at(image_index);
        const auto image_id = static_cast<int64_t>(image_index) + 1;

        json image_json = json::object();
        image_json["id"] = image_id;
        image_json["file_name"] = image.path.filename().string();
        image_json["width"] = image.dimensions ? image.dimensions->width : 0;
        image_json["height"] = image.dimensions ? image.dimensions->height : 0;
        image_json["date_captured"] = to_iso8601_string(metadata.creation_time);
        image_json["license"] = 1;
        images.push_back(std::move(image_json));

        for (size_t i = 0; i < image.annotations.size(); ++i) {
            const Annotation& annotation = image.annotations[i];
            if (not annotation.label) {
                log_warn("%s: skipping unlabeled annotation %s: COCO annotations require a category", image.path.string().c_str(), std::to_string(annotation.id.get()).c_str());
                ++num_skipped;
                continue;
            }

            const CodecErrorLocation location{
                .source = image.path.string(),
                .byte_offset = std::nullopt,
                .image_index = image_index,
                .annotation_index = i,
            };
            const ExportShape shape = to_export_shape(annotation.geometry, policy, location);
            if (shape.is_approximation) {
                ++num_approximated;
            }

            json segmentation = json::array();
            segmentation.push_back(to_flat_json_coordinates(shape.outline));

            json annotation_json = json::object();
            annotation_json["id"] = next_coco_annotation_id++;
            annotation_json["image_id"] = image_id;
            annotation_json["category_id"] = category_id_of(*annotation.label);
            annotation_json["segmentation"] = std::move(segmentation);
            annotation_json["area"] = to_json_number(shape.area);
            annotation_json["bbox"] = to_json_numbers({shape.bounds.left(), shape.bounds.top(), shape.bounds.width(), shape.bounds.height()});
            annotation_json["iscrowd"] = 0;
            annotations.push_back(std::move(annotation_json));
        }
    }

    json categories = json::array();
    for (const std::string& name : category_names) {
        json category = json::object();
        category["id"] = category_id_of(name);
        category["name"] = name;
        category["supercategory"] = "none";
        categories.push_back(std::move(category));
    }

    json document = json::object();
    document["info"] = info_of(metadata);
    document["licenses"] = licenses();
    document["images"] = std::move(images);
    document["annotations"] = std::move(annotations);
    document["categories"] = std::move(categories);

    out << dump_json_document(document) << '\n';

    if (num_skipped > 0) {
        log_warn("COCO: %zu unlabeled annotation(s) were not exported", num_skipped);
    }
    if (num_approximated > 0) {
        log_debug("COCO: %zu point/circle annotation(s) were approximated as polygons", num_approximated);
    }
}

Project iml::COCO::read(std::istream& in, std::string_view source_name, const Color& label_color)
{
    const json document = parse_json_document(in, source_name);
    const CodecErrorLocation location{.source = std::string{source_name}};
    if (not document.is_object()) {
        throw MalformedInput{location, "expected a COCO document object"};
    }

    const json& categories = require_array(document, "categories", location);
    const json& images = require_array(document, "images", location);
    const json& annotations = require_array(document, "annotations", location);

    Project rv;

    std::unordered_map<int64_t, std::string> category_names;
    for (const json& category : categories) {
        const std::optional<int64_t> id = try_get_integer(category, "id");
        if (not id) {
            throw MalformedInput{location, "categories: each category needs an integer id"};
        }
        std::string name = to_string_or_throw(require_member(category, "name", location), "categories: name", location);
        if (name.empty()) {
            throw MalformedInput{location, "categories: a category's name cannot be empty"};
        }
        if (not rv.has_label(name)) {
            rv.add_label(name, label_color);
        }
        category_names.insert_or_assign(*id, std::move(name));
    }

    std::unordered_map<int64_t, size_t> image_indices;
    for (size_t i = 0; i < images.size(); ++i) {
        CodecErrorLocation image_location = location;
        image_location.image_index = i;

        const json& image = images[i];
        const std::optional<int64_t> id = try_get_integer(image, "id");
        if (not id) {
            throw MalformedInput{image_location, "images: each image needs an integer id"};
        }
        std::string file_name = to_string_or_throw(require_member(image, "file_name", image_location), "file_name", image_location);

        std::optional<ImageDimensions> dimensions;
        const std::optional<int64_t> width = try_get_integer(image, "width");
        const std::optional<int64_t> height = try_get_integer(image, "height");
        if (width and height and *width > 0 and *height > 0) {
            dimensions = ImageDimensions{static_cast<int>(*width), static_cast<int>(*height)};
        }

        if (not image_indices.try_emplace(*id, rv.add_image(std::move(file_name), dimensions)).second) {
            throw MalformedInput{image_location, "images: image id " + std::to_string(*id) + " is used more than once"};
        }
    }

    size_t num_skipped = 0;
    for (size_t i = 0; i < annotations.size(); ++i) {
        CodecErrorLocation annotation_location = location;
        annotation_location.annotation_index = i;

        const json& annotation = annotations[i];
        if (not annotation.is_object()) {
            throw MalformedInput{annotation_location, "expected an annotation object"};
        }

        const std::optional<int64_t> image_id = try_get_integer(annotation, "image_id");
        const auto image_it = image_id ? image_indices.find(*image_id) : image_indices.end();
        if (image_it == image_indices.end()) {
            log_warn("%s: skipping annotation %zu: it refers to an unknown image", location.source.c_str(), i);
            ++num_skipped;
            continue;
        }
        annotation_location.image_index = image_it->second;

        const std::optional<int64_t> category_id = try_get_integer(annotation, "category_id");
        const auto category_it = category_id ? category_names.find(*category_id) : category_names.end();
        if (category_it == category_names.end()) {
            log_warn("%s: skipping annotation %zu: it refers to an unknown category", location.source.c_str(), i);
            ++num_skipped;
            continue;
        }

        rv.create_annotation(image_it->second, read_geometry(annotation, annotation_location), category_it->second);
    }

    log_info("%s: read %zu COCO annotation(s) (%zu skipped)", location.source.c_str(), rv.num_annotations(), num_skipped);
    return rv;
}

void iml::export_coco_file(
    const std::filesystem::path& path,
    const Project& project,
    const ApproximationPolicy& policy,
    const ExportMetadata& metadata)
{
    write_file_atomically(path, [&](std::ostream& out)
    {
        COCO::write(out, project, policy, metadata);
    });
    log_info("%s: exported COCO annotations for %zu image(s)", path.string().c_str(), project.num_images());
}

Project iml::import_coco_file(const std::filesystem::path& path, const Color& label_color)
{
    std::ifstream in{path, std::ios::binary};
    if (not in) {
        throw std::runtime_error{path.string() + ": cannot open COCO file for reading"};
    }
    return COCO::read(in, path.string(), label_color);
}
