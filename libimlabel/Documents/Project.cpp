#include "Project.h"

#include <libimlabel/Platform/Log.h>
#include <libimlabel/Utils/Exceptions.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace iml;

namespace
{
    std::string format_not_found(AnnotationID id)
    {
        std::stringstream ss;
        ss << "annotation " << id << " does not exist in the project";
        return std::move(ss).str();
    }

    void assert_id_available(AnnotationID::element_type next_id)
    {
        if (next_id > c_max_annotation_id) {
            throw std::overflow_error{"the project has run out of annotation ids"};
        }
    }

    std::string format_label_not_found(std::string_view name)
    {
        std::stringstream ss;
        ss << '\'' << name << "': no such label exists in the project";
        return std::move(ss).str();
    }

    template<typename Entries>
    auto find_annotation_in(Entries& images, AnnotationID id) -> decltype(&images.front().annotations.front())
    {
        for (auto& image : images) {
            const auto it = std::find_if(image.annotations.begin(), image.annotations.end(), [id](const Annotation& a)
            {
                return a.id == id;
            });
            if (it != image.annotations.end()) {
                return &*it;
            }
        }
        return nullptr;
    }
}

const ImageEntry& iml::Project::image_at(size_t image_index) const
{
    assert_image_index_in_bounds(image_index);
    return images_[image_index];
}

std::optional<size_t> iml::Project::find_image(const std::filesystem::path& path) const
{
    const auto it = std::find_if(images_.begin(), images_.end(), [&path](const ImageEntry& image)
    {
        return image.path == path;
    });
    if (it == images_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(images_.begin(), it));
}

size_t iml::Project::add_image(std::filesystem::path path, std::optional<ImageDimensions> dimensions)
{
    images_.push_back(ImageEntry{
        .path = std::move(path),
        .dimensions = dimensions,
        .annotations = {},
    });
    return images_.size() - 1;
}

void iml::Project::remove_image(size_t image_index)
{
    assert_image_index_in_bounds(image_index);
    images_.erase(images_.begin() + static_cast<std::ptrdiff_t>(image_index));
}

void iml::Project::set_image_dimensions(size_t image_index, std::optional<ImageDimensions> dimensions)
{
    assert_image_index_in_bounds(image_index);
    images_[image_index].dimensions = dimensions;
}

const std::vector<Annotation>& iml::Project::annotations(size_t image_index) const
{
    return image_at(image_index).annotations;
}

size_t iml::Project::num_annotations() const
{
    size_t rv = 0;
    for (const ImageEntry& image : images_) {
        rv += image.annotations.size();
    }
    return rv;
}

AnnotationID iml::Project::create_annotation(
    size_t image_index,
    AnnotationGeometry geometry,
    std::optional<std::string> label)
{
    assert_image_index_in_bounds(image_index);
    validate(geometry);
    assert_label_exists(label);
    assert_id_available(next_annotation_id_);

    const AnnotationID id{next_annotation_id_};
    images_[image_index].annotations.push_back(Annotation{
        .id = id,
        .geometry = std::move(geometry),
        .label = std::move(label),
        .color_override = std::nullopt,
    });
    ++next_annotation_id_;  // only after the push succeeded
    return id;
}

void iml::Project::insert_annotation(const AnnotationLocation& location, Annotation annotation)
{
    assert_image_index_in_bounds(location.image_index);
    auto& list = images_[location.image_index].annotations;
    if (location.position > list.size()) {
        std::stringstream ss;
        ss << location.position << ": annotation position is out of bounds (image " << location.image_index << " has " << list.size() << " annotations)";
        throw std::out_of_range{std::move(ss).str()};
    }
    if (not annotation.id or annotation.id.get() > c_max_annotation_id) {
        throw std::invalid_argument{"cannot insert an annotation that has an invalid id"};
    }
    if (contains_annotation(annotation.id)) {
        std::stringstream ss;
        ss << "annotation " << annotation.id << " already exists in the project";
        throw std::invalid_argument{std::move(ss).str()};
    }
    validate(annotation.geometry);
    assert_label_exists(annotation.label);

    const auto id = annotation.id.get();
    list.insert(list.begin() + static_cast<std::ptrdiff_t>(location.position), std::move(annotation));
    next_annotation_id_ = std::max(next_annotation_id_, id + 1);
}

Annotation iml::Project::delete_annotation(AnnotationID id)
{
    const AnnotationLocation location = locate_annotation(id);
    auto& list = images_[location.image_index].annotations;
    const auto it = list.begin() + static_cast<std::ptrdiff_t>(location.position);
    Annotation rv = std::move(*it);
    list.erase(it);
    return rv;
}

const Annotation& iml::Project::get_annotation(AnnotationID id) const
{
    if (const Annotation* annotation = try_get_annotation(id)) {
        return *annotation;
    }
    throw NotFound{format_not_found(id)};
}

const Annotation* iml::Project::try_get_annotation(AnnotationID id) const
{
    return find_annotation_in(images_, id);
}

AnnotationLocation iml::Project::locate_annotation(AnnotationID id) const
{
    if (const auto location = try_locate_annotation(id)) {
        return *location;
    }
    throw NotFound{format_not_found(id)};
}

std::optional<AnnotationLocation> iml::Project::try_locate_annotation(AnnotationID id) const
{
    for (size_t i = 0; i < images_.size(); ++i) {
        const auto& list = images_[i].annotations;
        for (size_t j = 0; j < list.size(); ++j) {
            if (list[j].id == id) {
                return AnnotationLocation{.image_index = i, .position = j};
            }
        }
    }
    return std::nullopt;
}

void iml::Project::set_label(AnnotationID id, std::optional<std::string> label_name)
{
    Annotation& annotation = upd_annotation(id);
    assert_label_exists(label_name);
    annotation.label = std::move(label_name);
}

void iml::Project::set_geometry(AnnotationID id, AnnotationGeometry geometry)
{
    Annotation& annotation = upd_annotation(id);
    if (kind_of(geometry) != kind_of(annotation.geometry)) {
        std::stringstream ss;
        ss << "cannot change annotation " << id << " from a " << kind_of(annotation.geometry) << " into a " << kind_of(geometry) << ": an annotation's kind is fixed";
        throw InvalidGeometry{std::move(ss).str()};
    }
    validate(geometry);
    annotation.geometry = std::move(geometry);
}

void iml::Project::set_color_override(AnnotationID id, std::optional<Color> color)
{
    upd_annotation(id).color_override = color;
}

Color iml::Project::effective_color_of(const Annotation& annotation, const Color& fallback) const
{
    if (annotation.color_override) {
        return *annotation.color_override;
    }
    if (annotation.label) {
        if (const Label* label = try_get_label(*annotation.label)) {
            return label->color;
        }
    }
    return fallback;
}

AnnotationID iml::Project::allocate_annotation_id()
{
    assert_id_available(next_annotation_id_);
    return AnnotationID{next_annotation_id_++};
}

void iml::Project::set_next_annotation_id(AnnotationID::element_type value)
{
    AnnotationID::element_type lowest_allowed = 1;
    for (const ImageEntry& image : images_) {
        for (const Annotation& annotation : image.annotations) {
            lowest_allowed = std::max(lowest_allowed, annotation.id.get() + 1);
        }
    }
    next_annotation_id_ = std::max(value, lowest_allowed);
}

const Label* iml::Project::try_get_label(std::string_view name) const
{
    const auto it = std::find_if(labels_.begin(), labels_.end(), [name](const Label& label)
    {
        return label.name == name;
    });
    return it != labels_.end() ? &*it : nullptr;
}

const Label& iml::Project::get_label(std::string_view name) const
{
    if (const Label* label = try_get_label(name)) {
        return *label;
    }
    throw NotFound{format_label_not_found(name)};
}

std::optional<size_t> iml::Project::find_label_index(std::string_view name) const
{
    for (size_t i = 0; i < labels_.size(); ++i) {
        if (labels_[i].name == name) {
            return i;
        }
    }
    return std::nullopt;
}

void iml::Project::add_label(std::string name, const Color& color)
{
    insert_label(labels_.size(), Label{.name = std::move(name), .color = color});
}

void iml::Project::insert_label(size_t position, Label label)
{
    if (label.name.empty()) {
        throw std::invalid_argument{"a label's name cannot be empty"};
    }
    if (has_label(label.name)) {
        throw DuplicateLabel{"'" + label.name + "': a label with this name already exists"};
    }
    position = std::min(position, labels_.size());
    labels_.insert(labels_.begin() + static_cast<std::ptrdiff_t>(position), std::move(label));
}

std::vector<AnnotationID> iml::Project::remove_label(std::string_view name, bool cascade)
{
    const std::optional<size_t> index = find_label_index(name);
    if (not index) {
        throw NotFound{format_label_not_found(name)};
    }

    std::vector<AnnotationID> users = annotations_with_label(name);
    if (not users.empty() and not cascade) {
        std::stringstream ss;
        ss << '\'' << name << "': cannot remove this label: it is used by " << users.size() << " annotation(s)";
        throw LabelInUse{std::move(ss).str()};
    }

    // everything that can throw has happened: commit
    for (ImageEntry& image : images_) {
        for (Annotation& annotation : image.annotations) {
            if (annotation.label and *annotation.label == name) {
                annotation.label.reset();
            }
        }
    }
    labels_.erase(labels_.begin() + static_cast<std::ptrdiff_t>(*index));
    if (not users.empty()) {
        log_debug("removed label '%s': cleared it from %zu annotation(s)", std::string{name}.c_str(), users.size());
    }
    return users;
}

void iml::Project::set_label_color(std::string_view name, const Color& color)
{
    const std::optional<size_t> index = find_label_index(name);
    if (not index) {
        throw NotFound{format_label_not_found(name)};
    }
    labels_[*index].color = color;
}

std::vector<AnnotationID> iml::Project::annotations_with_label(std::string_view name) const
{
    std::vector<AnnotationID> rv;
    for (const ImageEntry& image : images_) {
        for (const Annotation& annotation : image.annotations) {
            if (annotation.label and *annotation.label == name) {
                rv.push_back(annotation.id);
            }
        }
    }
    return rv;
}

Annotation* iml::Project::try_upd_annotation(AnnotationID id)
{
    return find_annotation_in(images_, id);
}

Annotation& iml::Project::upd_annotation(AnnotationID id)
{
    if (Annotation* annotation = try_upd_annotation(id)) {
        return *annotation;
    }
    throw NotFound{format_not_found(id)};
}

void iml::Project::assert_image_index_in_bounds(size_t image_index) const
{
    if (image_index >= images_.size()) {
        std::stringstream ss;
        ss << "image " << image_index << " does not exist in the project (it has " << images_.size() << " images)";
        throw NotFound{std::move(ss).str()};
    }
}

void iml::Project::assert_label_exists(const std::optional<std::string>& label_name) const
{
    if (label_name and not has_label(*label_name)) {
        throw NotFound{format_label_not_found(*label_name)};
    }
}
