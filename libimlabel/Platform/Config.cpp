#include "Config.h"

#include <libimlabel/Platform/Log.h>
#include <libimlabel/Platform/os.h>

#include <toml++/toml.h>

#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

using namespace iml;

namespace
{
    constexpr std::string_view c_config_filename = "imlabel.toml";

    std::optional<std::filesystem::path> try_get_config_location()
    {
        std::filesystem::path p = current_executable_directory();
        while (true) {
            const std::filesystem::path maybe_config = p / c_config_filename;
            std::error_code ec;
            if (std::filesystem::exists(maybe_config, ec)) {
                return maybe_config;
            }
            if (not p.has_relative_path()) {
                return std::nullopt;  // reached the root
            }
            p = p.parent_path();
        }
    }
}

class iml::Config::Impl final {
public:
    std::optional<std::filesystem::path> source_path;
    ViewportParameters viewport_parameters;
    double vertex_tolerance = 10.0;
    double edge_tolerance = 5.0;
    double min_drag_distance = 5.0;
    size_t max_history_depth = 50;
    Color default_label_color = Color::red();
    ApproximationPolicy approximation_policy;
    int voc_image_depth = 3;
};

namespace
{
    // reads an optional value, keeping `target` as-is (with a warning) if the value has the
    // wrong type or fails `is_valid`
    template<typename T, typename Validator>
    void try_read(
        const toml::table& table,
        std::string_view section,
        std::string_view key,
        T& target,
        Validator is_valid)
    {
        const toml::node_view<const toml::node> node = table[section][key];
        if (not node) {
            return;  // not specified: keep the default
        }

        std::optional<T> value;
        if constexpr (std::is_same_v<T, size_t> or std::is_same_v<T, int>) {
            const std::optional<int64_t> integer = node.value<int64_t>();
            if (integer and *integer >= 0 and std::cmp_less_equal(*integer, std::numeric_limits<T>::max())) {
                value = static_cast<T>(*integer);
            }
        }
        else {
            value = node.template value<T>();
        }

        if (not value or not is_valid(*value)) {
            log_warn("config: %.*s.%.*s: invalid value: the default will be used instead",
                static_cast<int>(section.size()), section.data(),
                static_cast<int>(key.size()), key.data());
            return;
        }
        target = *value;
    }

    bool is_positive(double v) { return std::isfinite(v) and v > 0.0; }

    void update_config_from_table(Config::Impl& config, const toml::table& table)
    {
        // [viewport]
        {
            ViewportParameters& params = config.viewport_parameters;
            ViewportParameters candidate = params;
            try_read(table, "viewport", "min_zoom", candidate.min_zoom, is_positive);
            try_read(table, "viewport", "max_zoom", candidate.max_zoom, is_positive);
            if (candidate.min_zoom > candidate.max_zoom) {
                log_warn("config: viewport.min_zoom (%f) is greater than viewport.max_zoom (%f): the default zoom bounds will be used instead", candidate.min_zoom, candidate.max_zoom);
                candidate.min_zoom = params.min_zoom;
                candidate.max_zoom = params.max_zoom;
            }
            try_read(table, "viewport", "zoom_step", candidate.zoom_step, [](double v) { return std::isfinite(v) and v > 1.0; });
            try_read(table, "viewport", "wheel_zoom_step", candidate.wheel_zoom_step, [](double v) { return std::isfinite(v) and v > 1.0; });
            try_read(table, "viewport", "fit_margin", candidate.fit_margin, [](double v) { return std::isfinite(v) and v > 0.0 and v <= 1.0; });
            params = candidate;
        }

        // [editing]
        try_read(table, "editing", "vertex_tolerance", config.vertex_tolerance, is_positive);
        try_read(table, "editing", "edge_tolerance", config.edge_tolerance, is_positive);
        try_read(table, "editing", "min_drag_distance", config.min_drag_distance, [](double v) { return std::isfinite(v) and v >= 0.0; });

        // [history]
        try_read(table, "history", "max_depth", config.max_history_depth, [](size_t v) { return v >= 1; });

        // [labels]
        {
            std::string color_string;
            try_read(table, "labels", "default_color", color_string, [](const std::string& s) { return try_parse_html_color_string(s).has_value(); });
            if (not color_string.empty()) {
                config.default_label_color = *try_parse_html_color_string(color_string);
            }
        }

        // [export]
        try_read(table, "export", "allow_approximation", config.approximation_policy.allow_approximation, [](bool) { return true; });
        try_read(table, "export", "circle_polygon_sides", config.approximation_policy.circle_polygon_sides, [](size_t v) { return v >= 3; });
        try_read(table, "export", "point_box_size", config.approximation_policy.point_box_size, is_positive);
        try_read(table, "export", "voc_image_depth", config.voc_image_depth, [](int v) { return v >= 1; });
    }
}

Config iml::Config::load()
{
    const std::optional<std::filesystem::path> maybe_config_path = try_get_config_location();

    // can't find a config file: not an error, but worth mentioning
    if (not maybe_config_path) {
        log_info("could not find an %s configuration file: defaults will be used", c_config_filename.data());
        return Config{};
    }
    return load(*maybe_config_path);
}

Config iml::Config::load(const std::filesystem::path& path)
{
    auto impl = std::make_unique<Impl>();
    impl->source_path = path;

    toml::table table;
    try {
        table = toml::parse_file(path.string());
    }
    catch (const std::exception& ex) {
        log_error("error parsing config toml: %s", ex.what());
        log_error("defaults will be used instead: you might need to fix the config file at %s", path.string().c_str());
        return Config{std::move(impl)};
    }

    update_config_from_table(*impl, table);
    log_info("loaded configuration from %s", path.string().c_str());
    return Config{std::move(impl)};
}

Config iml::Config::from_toml_string(std::string_view toml_source, std::string_view source_name)
{
    auto impl = std::make_unique<Impl>();

    toml::table table;
    try {
        table = toml::parse(toml_source, source_name);
    }
    catch (const std::exception& ex) {
        log_error("error parsing config toml: %s", ex.what());
        return Config{std::move(impl)};
    }

    update_config_from_table(*impl, table);
    return Config{std::move(impl)};
}

iml::Config::Config() :
    impl_{std::make_unique<Impl>()}
{}

iml::Config::Config(std::unique_ptr<Impl> impl) :
    impl_{std::move(impl)}
{}

iml::Config::Config(Config&&) noexcept = default;
Config& iml::Config::operator=(Config&&) noexcept = default;
iml::Config::~Config() noexcept = default;

std::optional<std::filesystem::path> iml::Config::source_path() const
{
    return impl_->source_path;
}

const ViewportParameters& iml::Config::viewport_parameters() const
{
    return impl_->viewport_parameters;
}

double iml::Config::vertex_tolerance() const
{
    return impl_->vertex_tolerance;
}

double iml::Config::edge_tolerance() const
{
    return impl_->edge_tolerance;
}

double iml::Config::min_drag_distance() const
{
    return impl_->min_drag_distance;
}

size_t iml::Config::max_history_depth() const
{
    return impl_->max_history_depth;
}

Color iml::Config::default_label_color() const
{
    return impl_->default_label_color;
}

const ApproximationPolicy& iml::Config::approximation_policy() const
{
    return impl_->approximation_policy;
}

int iml::Config::voc_image_depth() const
{
    return impl_->voc_image_depth;
}

PascalVOCParameters iml::Config::pascal_voc_parameters() const
{
    return PascalVOCParameters{
        .approximation_policy = impl_->approximation_policy,
        .image_depth = impl_->voc_image_depth,
    };
}
