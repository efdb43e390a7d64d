#include "NativeJSON.h"

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationKind.h>
#include <libimlabel/Documents/ImageEntry.h>
#include <libimlabel/Documents/ProjectHelpers.h>
#include <libimlabel/Formats/JSONHelpers.h>
#include <libimlabel/Graphics/Color.h>
#include <libimlabel/Maths/Circle.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>
#include <libimlabel/Platform/FilesystemHelpers.h>
#include <libimlabel/Platform/Log.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/Overload.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <variant>

using namespace iml;
using json = nlohmann::ordered_json;

namespace
{
    constexpr std::string_view c_native_annotation_suffix = "_annotations.json";

    // an annotation, as read from a document, before its color has been resolved
    // against the label table
    struct ParsedAnnotation final {
        Annotation annotation;
        Color color;
        std::optional<bool> recorded_as_override;
        CodecErrorLocation location;
    };

    // an image object, as read from a document
    struct ParsedImage final {
        std::filesystem::path path;
        std::optional<ImageDimensions> dimensions;
        std::vector<Label> labels;
        std::vector<ParsedAnnotation> annotations;
    };

    json coordinates_of(const AnnotationGeometry& geometry)
    {
        json rv = json::array();
        const auto push = [&rv](double v) { rv.push_back(to_json_number(v)); };

        std::visit(Overload{
            [&](const Vec2& p)
            {
                push(p.x);
                push(p.y);
            },
            [&](const Rect& r)
            {
                push(r.left());
                push(r.top());
                push(r.right());
                push(r.bottom());
            },
            [&](const Circle& c)
            {
                push(c.origin.x);
                push(c.origin.y);
                push(c.radius);
            },
            [&](const Polygon& p)
            {
                for (const Vec2& v : p.vertices) {
                    push(v.x);
                    push(v.y);
                }
            },
        }, geometry);

        return rv;
    }

    json annotation_to_json(const Project& project, const Annotation& annotation, const Color& default_color)
    {
        json rv = json::object();
        rv["type"] = std::string{to_string_view(kind_of(annotation))};
        rv["coordinates"] = coordinates_of(annotation.geometry);
        rv["label"] = annotation.label ? json(*annotation.label) : json(nullptr);
        rv["color"] = to_html_string_rgb(project.effective_color_of(annotation, default_color));
        return rv;
    }

    json label_names_of(const Project& project)
    {
        json rv = json::array();
        for (const Label& label : project.labels()) {
            rv.push_back(label.name);
        }
        return rv;
    }

    json label_colors_of(const Project& project)
    {
        json rv = json::object();
        for (const Label& label : project.labels()) {
            rv[label.name] = to_html_string_rgb(label.color);
        }
        return rv;
    }

    json annotation_types_of(const ImageEntry& image)
    {
        json rv = json::array();
        for (const std::string& name : present_kind_names(image.annotations)) {
            rv.push_back(name);
        }
        return rv;
    }

    void append_annotation_members(json& object, const Project& project, const ImageEntry& image, const Color& default_color)
    {
        json annotations = json::array();
        for (const Annotation& annotation : image.annotations) {
            annotations.push_back(annotation_to_json(project, annotation, default_color));
        }
        object["annotations"] = std::move(annotations);
    }

    void append_id_members(json& object, const ImageEntry& image)
    {
        json ids = json::array();
        json overrides = json::array();
        for (const Annotation& annotation : image.annotations) {
            ids.push_back(annotation.id.get());
            if (annotation.color_override) {
                overrides.push_back(annotation.id.get());
            }
        }
        object["annotation_ids"] = std::move(ids);
        object["color_overrides"] = std::move(overrides);
    }

    json standalone_image_to_json(
        const Project& project,
        const ImageEntry& image,
        const ExportMetadata& metadata,
        const Color& default_color)
    {
        json rv = json::object();
        rv["image_path"] = image.path.string();
        rv["image_name"] = image.path.filename().string();
        append_annotation_members(rv, project, image, default_color);
        rv["labels"] = label_names_of(project);
        rv["label_colors"] = label_colors_of(project);
        rv["total_annotations"] = image.annotations.size();
        rv["annotation_types"] = annotation_types_of(image);
        rv["creation_date"] = to_iso8601_string(metadata.creation_time);
        append_id_members(rv, image);
        return rv;
    }

    json project_image_to_json(
        const Project& project,
        const ImageEntry& image,
        const std::filesystem::path& project_directory,
        const Color& default_color)
    {
        std::filesystem::path relative_path = project_directory.empty() ?
            image.path :
            image.path.lexically_relative(project_directory);
        if (relative_path.empty()) {
            relative_path = image.path;
        }

        json rv = json::object();
        rv["image_path"] = image.path.string();
        rv["image_name"] = image.path.filename().string();
        rv["relative_path"] = relative_path.generic_string();
        rv["width"] = image.dimensions ? image.dimensions->width : 0;
        rv["height"] = image.dimensions ? image.dimensions->height : 0;
        append_annotation_members(rv, project, image, default_color);
        rv["total_annotations"] = image.annotations.size();
        rv["annotation_types"] = annotation_types_of(image);
        append_id_members(rv, image);
        return rv;
    }

    const json* try_find_member(const json& object, const char* key)
    {
        const auto it = object.find(key);
        return it != object.end() ? &(*it) : nullptr;
    }

    Color parse_color_or_throw(const json& value, std::string_view what, const CodecErrorLocation& location)
    {
        const std::string str = to_string_or_throw(value, what, location);
        if (const auto color = try_parse_html_color_string(str)) {
            return *color;
        }
        throw MalformedInput{location, std::string{what} + ": '" + str + "' is not a valid color (expected '#RRGGBB')"};
    }

    void add_label_if_missing(std::vector<Label>& labels, std::string name, const Color& color)
    {
        const bool exists = std::any_of(labels.begin(), labels.end(), [&name](const Label& label)
        {
            return label.name == name;
        });
        if (not exists) {
            labels.push_back(Label{.name = std::move(name), .color = color});
        }
    }

    // reads `labels` and `label_colors` from an object that may contain them
    std::vector<Label> read_labels(const json& object, const CodecErrorLocation& location, const Color& default_color)
    {
        const json* colors = try_find_member(object, "label_colors");
        if (colors and not colors->is_object()) {
            throw MalformedInput{location, "label_colors: expected an object that maps label names to colors"};
        }

        std::vector<Label> rv;
        const auto add = [&rv, &location](const std::string& name, const Color& color)
        {
            if (name.empty()) {
                throw MalformedInput{location, "labels: a label's name cannot be empty"};
            }
            add_label_if_missing(rv, name, color);
        };

        if (const json* names = try_find_member(object, "labels")) {
            if (not names->is_array()) {
                throw MalformedInput{location, "labels: expected an array of label names"};
            }
            for (const json& element : *names) {
                const std::string name = to_string_or_throw(element, "labels", location);
                Color color = default_color;
                if (colors) {
                    if (const auto it = colors->find(name); it != colors->end()) {
                        color = parse_color_or_throw(*it, "label_colors", location);
                    }
                }
                add(name, color);
            }
        }

        // colors of labels that are not listed in `labels`
        if (colors) {
            for (const auto& item : colors->items()) {
                add(item.key(), parse_color_or_throw(item.value(), "label_colors", location));
            }
        }

        return rv;
    }

    AnnotationGeometry read_geometry(
        AnnotationKind kind,
        const std::vector<double>& c,
        const CodecErrorLocation& location)
    {
        const auto require_num_values = [&](bool ok, std::string_view expected)
        {
            if (not ok) {
                std::stringstream ss;
                ss << "coordinates: a " << kind << " needs " << expected << " values, but " << c.size() << " were given";
                throw MalformedInput{location, std::move(ss).str()};
            }
        };

        switch (kind) {
        case AnnotationKind::Point:
            require_num_values(c.size() == 2, "2");
            return Vec2{c[0], c[1]};
        case AnnotationKind::Rectangle:
            require_num_values(c.size() == 4, "4");
            return Rect::from_corners({c[0], c[1]}, {c[2], c[3]});
        case AnnotationKind::Circle:
            require_num_values(c.size() == 3 or c.size() == 4, "3 (or a 4-value bounding box)");
            if (c.size() == 3) {
                return Circle{.origin = {c[0], c[1]}, .radius = c[2]};
            }
            else {
                // legacy: the circle inscribed in a bounding box
                const Rect bounds = Rect::from_corners({c[0], c[1]}, {c[2], c[3]});
                return Circle{
                    .origin = midpoint(bounds.p1(), bounds.p2()),
                    .radius = 0.5 * std::min(bounds.width(), bounds.height()),
                };
            }
        case AnnotationKind::Polygon:
        {
            require_num_values(c.size() >= 6 and c.size() % 2 == 0, "an even number (at least 6) of");
            Polygon polygon;
            polygon.vertices.reserve(c.size() / 2);
            for (size_t i = 0; i < c.size(); i += 2) {
                polygon.vertices.push_back({c[i], c[i+1]});
            }
            return polygon;
        }
        default:
            throw MalformedInput{location, "coordinates: unknown annotation kind"};
        }
    }

    ParsedAnnotation read_annotation(const json& value, const CodecErrorLocation& location, const Color& default_color)
    {
        if (not value.is_object()) {
            throw MalformedInput{location, "expected an annotation object"};
        }

        const std::string type = to_string_or_throw(require_member(value, "type", location), "type", location);
        const std::optional<AnnotationKind> kind = try_parse_as_annotation_kind(type);
        if (not kind) {
            throw MalformedInput{location, "type: '" + type + "' is not a known annotation type"};
        }

        const std::vector<double> coordinates = to_number_vector(require_member(value, "coordinates", location), "coordinates", location);
        AnnotationGeometry geometry = read_geometry(*kind, coordinates, location);
        try {
            validate(geometry);
        }
        catch (const InvalidGeometry& ex) {
            throw MalformedInput{location, std::string{"coordinates: "} + ex.what()};
        }

        std::optional<std::string> label;
        if (const json* label_value = try_find_member(value, "label")) {
            label = to_optional_string_or_throw(*label_value, "label", location);
            if (label and label->empty()) {
                label.reset();
            }
        }

        const json* color_value = try_find_member(value, "color");
        const std::optional<Color> color = color_value ? std::optional<Color>{parse_color_or_throw(*color_value, "color", location)} : std::nullopt;

        return ParsedAnnotation{
            .annotation = Annotation{
                .id = AnnotationID{},
                .geometry = std::move(geometry),
                .label = std::move(label),
                .color_override = std::nullopt,
            },
            .color = color.value_or(default_color),
            .recorded_as_override = color ? std::nullopt : std::optional<bool>{false},
            .location = location,
        };
    }

    std::optional<std::vector<int64_t>> read_optional_id_list(
        const json& object,
        const char* key,
        const CodecErrorLocation& location)
    {
        const json* value = try_find_member(object, key);
        if (not value) {
            return std::nullopt;
        }
        if (not value->is_array()) {
            throw MalformedInput{location, std::string{key} + ": expected an array of annotation ids"};
        }

        std::vector<int64_t> rv;
        rv.reserve(value->size());
        for (const json& element : *value) {
            if (not element.is_number_integer() or element.get<int64_t>() <= 0 or element.get<int64_t>() > c_max_annotation_id) {
                std::stringstream ss;
                ss << key << ": annotation ids must be integers in the range [1, " << c_max_annotation_id << ']';
                throw MalformedInput{location, std::move(ss).str()};
            }
            rv.push_back(element.get<int64_t>());
        }
        return rv;
    }

    std::optional<ImageDimensions> read_dimensions(const json& object, const CodecErrorLocation& location)
    {
        const json* width = try_find_member(object, "width");
        const json* height = try_find_member(object, "height");
        if (not width or not height or width->is_null() or height->is_null()) {
            return std::nullopt;
        }
        if (not width->is_number_integer() or not height->is_number_integer()) {
            throw MalformedInput{location, "width/height: expected integers"};
        }
        const auto w = width->get<int64_t>();
        const auto h = height->get<int64_t>();
        if (w <= 0 or h <= 0 or w > INT32_MAX or h > INT32_MAX) {
            return std::nullopt;  // unknown
        }
        return ImageDimensions{static_cast<int>(w), static_cast<int>(h)};
    }

    ParsedImage read_image_object(const json& object, const CodecErrorLocation& location, const Color& default_color)
    {
        if (not object.is_object()) {
            throw MalformedInput{location, "expected an image object"};
        }

        ParsedImage rv;
        rv.path = to_string_or_throw(require_member(object, "image_path", location), "image_path", location);
        rv.dimensions = read_dimensions(object, location);
        rv.labels = read_labels(object, location, default_color);

        const json& annotations = require_member(object, "annotations", location);
        if (not annotations.is_array()) {
            throw MalformedInput{location, "annotations: expected an array"};
        }

        const std::optional<std::vector<int64_t>> ids = read_optional_id_list(object, "annotation_ids", location);
        if (ids and ids->size() != annotations.size()) {
            std::stringstream ss;
            ss << "annotation_ids: has " << ids->size() << " entries, but there are " << annotations.size() << " annotations";
            throw MalformedInput{location, std::move(ss).str()};
        }
        const std::optional<std::vector<int64_t>> overrides = read_optional_id_list(object, "color_overrides", location);
        if (overrides and not ids) {
            throw MalformedInput{location, "color_overrides: requires annotation_ids"};
        }

        rv.annotations.reserve(annotations.size());
        for (size_t i = 0; i < annotations.size(); ++i) {
            CodecErrorLocation annotation_location = location;
            annotation_location.annotation_index = i;

            ParsedAnnotation parsed = read_annotation(annotations[i], annotation_location, default_color);
            if (ids) {
                parsed.annotation.id = AnnotationID{(*ids)[i]};
            }
            if (overrides and parsed.recorded_as_override != false) {
                parsed.recorded_as_override = std::find(overrides->begin(), overrides->end(), (*ids)[i]) != overrides->end();
            }
            rv.annotations.push_back(std::move(parsed));
        }
        return rv;
    }

    // resolves each annotation's color against `labels`, adding any label that an
    // annotation references but that `labels` doesn't contain
    std::vector<Annotation> resolve_annotations(
        std::vector<ParsedAnnotation> parsed,
        std::vector<Label>& labels,
        const Color& default_color)
    {
        std::vector<Annotation> rv;
        rv.reserve(parsed.size());
        for (ParsedAnnotation& p : parsed) {
            Annotation& annotation = p.annotation;
            if (annotation.label) {
                add_label_if_missing(labels, *annotation.label, p.color);
            }

            Color inherited = default_color;
            if (annotation.label) {
                const auto it = std::find_if(labels.begin(), labels.end(), [&annotation](const Label& label)
                {
                    return label.name == *annotation.label;
                });
                inherited = it->color;
            }

            const bool is_override = p.recorded_as_override ? *p.recorded_as_override : (p.color != inherited);
            if (is_override) {
                annotation.color_override = p.color;
            }
            rv.push_back(std::move(annotation));
        }
        return rv;
    }

    void ensure_image_index_in_bounds(const Project& project, size_t image_index)
    {
        if (image_index >= project.num_images()) {
            std::stringstream ss;
            ss << image_index << ": image index is out of bounds (the project has " << project.num_images() << " images)";
            throw NotFound{std::move(ss).str()};
        }
    }
}

void iml::NativeJSON::write_image(
    std::ostream& out,
    const Project& project,
    size_t image_index,
    const ExportMetadata& metadata,
    const Color& default_color)
{
    ensure_image_index_in_bounds(project, image_index);
    out << dump_json_document(standalone_image_to_json(project, project.image_at(image_index), metadata, default_color)) << '\n';
}

ImageAnnotationSet iml::NativeJSON::read_image(std::istream& in, std::string_view source_name, const Color& default_color)
{
    const json document = parse_json_document(in, source_name);
    const CodecErrorLocation location{.source = std::string{source_name}};

    ParsedImage parsed = read_image_object(document, location, default_color);

    ImageAnnotationSet rv;
    rv.image_path = std::move(parsed.path);
    rv.labels = std::move(parsed.labels);
    rv.annotations = resolve_annotations(std::move(parsed.annotations), rv.labels, default_color);
    return rv;
}

void iml::NativeJSON::write_project(
    std::ostream& out,
    const Project& project,
    const std::filesystem::path& project_directory,
    const ExportMetadata& metadata,
    const Color& default_color)
{
    const AnnotationStatistics statistics = calc_statistics(project);
    json annotation_types = json::array();
    for (size_t i = 0; i < statistics.num_by_kind.size(); ++i) {
        if (statistics.num_by_kind[i] > 0) {
            annotation_types.push_back(std::string{to_string_view(static_cast<AnnotationKind>(i))});
        }
    }

    json info = json::object();
    info["total_images"] = project.num_images();
    info["total_annotations"] = project.num_annotations();
    info["labels"] = label_names_of(project);
    info["label_colors"] = label_colors_of(project);
    info["creation_date"] = to_iso8601_string(metadata.creation_time);
    info["annotation_types"] = std::move(annotation_types);
    info["created_by"] = metadata.authoring_tool;
    info["next_annotation_id"] = project.next_annotation_id();

    json images = json::array();
    for (const ImageEntry& image : project.images()) {
        images.push_back(project_image_to_json(project, image, project_directory, default_color));
    }

    json document = json::object();
    document["dataset_info"] = std::move(info);
    document["images"] = std::move(images);

    out << dump_json_document(document) << '\n';
}

Project iml::NativeJSON::read_project(std::istream& in, std::string_view source_name, const Color& default_color)
{
    const json document = parse_json_document(in, source_name);
    const CodecErrorLocation location{.source = std::string{source_name}};
    if (not document.is_object()) {
        throw MalformedInput{location, "expected a project object"};
    }

    std::vector<Label> labels;
    std::optional<int64_t> next_annotation_id;
    if (const json* info = try_find_member(document, "dataset_info")) {
        if (not info->is_object()) {
            throw MalformedInput{location, "dataset_info: expected an object"};
        }
        labels = read_labels(*info, location, default_color);
        if (const json* next = try_find_member(*info, "next_annotation_id")) {
            if (not next->is_number_integer()) {
                throw MalformedInput{location, "next_annotation_id: expected an integer"};
            }
            next_annotation_id = next->get<int64_t>();
        }
    }

    const json& images = require_member(document, "images", location);
    if (not images.is_array()) {
        throw MalformedInput{location, "images: expected an array"};
    }

    // parse everything, and check that recorded ids are unique
    std::vector<ParsedImage> parsed_images;
    parsed_images.reserve(images.size());
    std::unordered_set<int64_t> seen_ids;
    int64_t max_id = 0;
    for (size_t i = 0; i < images.size(); ++i) {
        CodecErrorLocation image_location = location;
        image_location.image_index = i;

        ParsedImage& parsed = parsed_images.emplace_back(read_image_object(images[i], image_location, default_color));
        for (const Label& label : parsed.labels) {
            add_label_if_missing(labels, label.name, label.color);
        }
        for (const ParsedAnnotation& annotation : parsed.annotations) {
            if (not annotation.annotation.id) {
                continue;
            }
            if (not seen_ids.insert(annotation.annotation.id.get()).second) {
                std::stringstream ss;
                ss << "annotation_ids: annotation id " << annotation.annotation.id << " is used more than once";
                throw MalformedInput{annotation.location, std::move(ss).str()};
            }
            max_id = std::max(max_id, annotation.annotation.id.get());
        }
    }

    // resolve colors against the combined label table
    std::vector<std::vector<Annotation>> annotations_per_image;
    annotations_per_image.reserve(parsed_images.size());
    for (ParsedImage& parsed : parsed_images) {
        annotations_per_image.push_back(resolve_annotations(std::move(parsed.annotations), labels, default_color));
    }

    Project rv;
    for (Label& label : labels) {
        rv.add_label(std::move(label.name), label.color);
    }
    int64_t fresh_id = max_id + 1;
    for (size_t i = 0; i < parsed_images.size(); ++i) {
        const size_t image_index = rv.add_image(std::move(parsed_images[i].path), parsed_images[i].dimensions);
        for (Annotation& annotation : annotations_per_image[i]) {
            if (not annotation.id) {
                if (fresh_id > c_max_annotation_id) {
                    throw MalformedInput{location, "annotation_ids: there are no free ids left for annotations that lack one"};
                }
                annotation.id = AnnotationID{fresh_id++};
            }
            rv.insert_annotation({image_index, rv.annotations(image_index).size()}, std::move(annotation));
        }
    }
    if (next_annotation_id) {
        rv.set_next_annotation_id(*next_annotation_id);
    }
    return rv;
}

void iml::import_image_annotations(Project& project, size_t image_index, const ImageAnnotationSet& set)
{
    ensure_image_index_in_bounds(project, image_index);

    Project copy = project;
    for (const Label& label : set.labels) {
        if (not copy.has_label(label.name)) {
            copy.add_label(label.name, label.color);
        }
    }
    while (not copy.annotations(image_index).empty()) {
        copy.delete_annotation(copy.annotations(image_index).back().id);
    }
    for (Annotation annotation : set.annotations) {
        if (not annotation.id or copy.contains_annotation(annotation.id)) {
            annotation.id = copy.allocate_annotation_id();
        }
        if (annotation.label and not copy.has_label(*annotation.label)) {
            copy.add_label(*annotation.label, annotation.color_override.value_or(c_unlabeled_annotation_color));
        }
        copy.insert_annotation({image_index, copy.annotations(image_index).size()}, std::move(annotation));
    }
    project = std::move(copy);

    log_info("%s: imported %zu annotation(s)", project.image_at(image_index).path.string().c_str(), set.annotations.size());
}

std::filesystem::path iml::native_annotation_path_for(const std::filesystem::path& image_path)
{
    return image_path.parent_path() / (image_path.stem().string() + std::string{c_native_annotation_suffix});
}

AnnotationFilesLoadResult iml::load_image_annotation_files(Project& project, const Color& default_color)
{
    AnnotationFilesLoadResult rv;
    for (size_t i = 0; i < project.num_images(); ++i) {
        const std::filesystem::path path = native_annotation_path_for(project.image_at(i).path);
        std::error_code ec;
        if (not std::filesystem::is_regular_file(path, ec)) {
            continue;
        }

        try {
            std::ifstream in{path, std::ios::binary};
            if (not in) {
                throw std::runtime_error{"cannot open file for reading"};
            }
            const ImageAnnotationSet set = NativeJSON::read_image(in, path.string(), default_color);
            import_image_annotations(project, i, set);
            ++rv.num_loaded;
        }
        catch (const std::runtime_error& ex) {
            log_error("%s: could not load annotations: %s", path.string().c_str(), ex.what());
            rv.failed.push_back(path);
        }
    }

    if (rv.num_loaded == 0 and rv.failed.empty()) {
        log_info("no per-image annotation files found");
    }
    return rv;
}

void iml::save_project_file(
    const std::filesystem::path& path,
    const Project& project,
    const ExportMetadata& metadata,
    const Color& default_color)
{
    const std::filesystem::path directory = path.parent_path();
    write_file_atomically(path, [&](std::ostream& out)
    {
        NativeJSON::write_project(out, project, directory, metadata, default_color);
    });
    log_info("%s: saved project (%zu images, %zu annotations)", path.string().c_str(), project.num_images(), project.num_annotations());
}

Project iml::load_project_file(const std::filesystem::path& path, const Color& default_color)
{
    std::ifstream in{path, std::ios::binary};
    if (not in) {
        throw std::runtime_error{path.string() + ": cannot open project file for reading"};
    }
    Project rv = NativeJSON::read_project(in, path.string(), default_color);
    log_info("%s: loaded project (%zu images, %zu annotations)", path.string().c_str(), rv.num_images(), rv.num_annotations());
    return rv;
}

std::vector<std::filesystem::path> iml::export_native_annotation_files(
    const std::filesystem::path& output_directory,
    const Project& project,
    const ExportMetadata& metadata,
    const Color& default_color)
{
    // render everything before touching the filesystem
    std::vector<std::pair<std::filesystem::path, std::string>> documents;
    documents.reserve(project.num_images());
    UniqueFilenameAllocator filenames{output_directory};
    for (size_t i = 0; i < project.num_images(); ++i) {
        std::stringstream ss;
        NativeJSON::write_image(ss, project, i, metadata, default_color);

        const std::filesystem::path& image_path = project.image_at(i).path;
        std::filesystem::path destination = filenames.claim(image_path.stem().string(), c_native_annotation_suffix);
        if (destination.filename() != native_annotation_path_for(image_path).filename()) {
            log_warn("%s: another image already exports to %s: writing %s instead", image_path.string().c_str(), native_annotation_path_for(image_path).filename().string().c_str(), destination.filename().string().c_str());
        }
        documents.emplace_back(std::move(destination), std::move(ss).str());
    }

    std::filesystem::create_directories(output_directory);

    std::vector<std::filesystem::path> rv;
    rv.reserve(documents.size());
    for (const auto& [path, content] : documents) {
        write_file_atomically(path, content);
        rv.push_back(path);
    }
    log_info("%s: wrote %zu native annotation file(s)", output_directory.string().c_str(), rv.size());
    return rv;
}
