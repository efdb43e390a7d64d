#pragma once

#include <libimlabel/Formats/ApproximationPolicy.h>
#include <libimlabel/Formats/PascalVOC.h>
#include <libimlabel/Graphics/Color.h>
#include <libimlabel/Maths/Viewport.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>

namespace iml
{
    // runtime configuration, loaded from an `imlabel.toml` file
    //
    // any value that is missing or invalid in the file keeps its default, so a
    // `Config` is always usable
    class Config final {
    public:
        // searches for `imlabel.toml` in the executable's directory, then its parent
        // directories, and loads the first one that is found
        static Config load();

        // loads the configuration file at `path`
        static Config load(const std::filesystem::path& path);

        // loads configuration from TOML source text
        static Config from_toml_string(std::string_view toml_source, std::string_view source_name = "<string>");

        class Impl;
    public:
        Config();  // defaults
        Config(const Config&) = delete;
        Config(Config&&) noexcept;
        Config& operator=(const Config&) = delete;
        Config& operator=(Config&&) noexcept;
        ~Config() noexcept;

        // the file that the configuration was loaded from, if any
        std::optional<std::filesystem::path> source_path() const;

        const ViewportParameters& viewport_parameters() const;

        // hit-testing tolerances, in canvas pixels
        double vertex_tolerance() const;
        double edge_tolerance() const;

        // the shortest (canvas pixel) drag that creates a rectangle or circle
        double min_drag_distance() const;

        size_t max_history_depth() const;

        // the color that newly-created labels are given if the user doesn't pick one
        Color default_label_color() const;

        const ApproximationPolicy& approximation_policy() const;
        int voc_image_depth() const;
        PascalVOCParameters pascal_voc_parameters() const;

    private:
        explicit Config(std::unique_ptr<Impl>);

        std::unique_ptr<Impl> impl_;
    };
}
