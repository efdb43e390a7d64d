#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Documents/ImageEntry.h>
#include <libimlabel/Documents/Label.h>
#include <libimlabel/Graphics/Color.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace iml
{
    // where an annotation lives within a project
    struct AnnotationLocation final {
        friend bool operator==(const AnnotationLocation&, const AnnotationLocation&) = default;

        size_t image_index = 0;
        size_t position = 0;  // z-order index within the image's annotation list
    };

    // the aggregate root of the annotation model: an ordered sequence of images,
    // each owning its annotations, plus the label set shared by all images
    //
    // all mutating member functions either fully apply or throw, leaving the
    // project unchanged
    class Project final {
    public:
        // images

        size_t num_images() const { return images_.size(); }
        const std::vector<ImageEntry>& images() const { return images_; }
        const ImageEntry& image_at(size_t image_index) const;
        std::optional<size_t> find_image(const std::filesystem::path&) const;
        size_t add_image(std::filesystem::path, std::optional<ImageDimensions> = std::nullopt);
        void remove_image(size_t image_index);
        void set_image_dimensions(size_t image_index, std::optional<ImageDimensions>);

        // annotations

        // returns the annotations of the given image in z-order (bottom-most first)
        const std::vector<Annotation>& annotations(size_t image_index) const;
        size_t num_annotations() const;

        // validates `geometry` and `label` and appends a new annotation to the
        // given image, returning the newly-allocated id
        //
        // throws `std::overflow_error` if the project has run out of ids
        AnnotationID create_annotation(
            size_t image_index,
            AnnotationGeometry geometry,
            std::optional<std::string> label = std::nullopt
        );

        // inserts an already-identified annotation at `location` (e.g. when
        // restoring a deleted annotation)
        //
        // throws `std::invalid_argument` if the id is invalid, above `c_max_annotation_id`,
        // or already in the project
        void insert_annotation(const AnnotationLocation&, Annotation);

        // removes the annotation and returns it
        Annotation delete_annotation(AnnotationID);

        const Annotation& get_annotation(AnnotationID) const;
        const Annotation* try_get_annotation(AnnotationID) const;
        bool contains_annotation(AnnotationID id) const { return try_get_annotation(id) != nullptr; }
        AnnotationLocation locate_annotation(AnnotationID) const;
        std::optional<AnnotationLocation> try_locate_annotation(AnnotationID) const;

        void set_label(AnnotationID, std::optional<std::string> label_name);
        void set_geometry(AnnotationID, AnnotationGeometry);
        void set_color_override(AnnotationID, std::optional<Color>);

        // returns the annotation's display color: its override, then its label's
        // color, then `fallback`
        Color effective_color_of(const Annotation&, const Color& fallback = c_unlabeled_annotation_color) const;

        // annotation ids

        // throws `std::overflow_error` if every id up to `c_max_annotation_id` is used up
        AnnotationID allocate_annotation_id();
        AnnotationID::element_type next_annotation_id() const { return next_annotation_id_; }

        // sets the id counter, which is raised if necessary so that it is always
        // greater than every id in the project
        void set_next_annotation_id(AnnotationID::element_type);

        // labels

        const std::vector<Label>& labels() const { return labels_; }
        bool has_label(std::string_view name) const { return try_get_label(name) != nullptr; }
        const Label* try_get_label(std::string_view name) const;
        const Label& get_label(std::string_view name) const;
        std::optional<size_t> find_label_index(std::string_view name) const;

        // throws `DuplicateLabel` if a label with the same name already exists
        void add_label(std::string name, const Color&);
        void insert_label(size_t position, Label);

        // removes the label, returning the ids of annotations whose reference to
        // it was cleared
        //
        // throws `LabelInUse` if `cascade` is `false` and any annotation refers to
        // the label
        std::vector<AnnotationID> remove_label(std::string_view name, bool cascade);

        void set_label_color(std::string_view name, const Color&);

        std::vector<AnnotationID> annotations_with_label(std::string_view name) const;

        // the id counter is deliberately excluded: it only ever moves forward
        friend bool operator==(const Project& lhs, const Project& rhs)
        {
            return lhs.images_ == rhs.images_ and lhs.labels_ == rhs.labels_;
        }

    private:
        Annotation* try_upd_annotation(AnnotationID);
        Annotation& upd_annotation(AnnotationID);
        void assert_image_index_in_bounds(size_t) const;
        void assert_label_exists(const std::optional<std::string>&) const;

        std::vector<ImageEntry> images_;
        std::vector<Label> labels_;
        AnnotationID::element_type next_annotation_id_ = 1;
    };
}
