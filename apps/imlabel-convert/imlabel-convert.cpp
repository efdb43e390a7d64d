#include <libimlabel/Documents/ProjectHelpers.h>
#include <libimlabel/Formats/COCO.h>
#include <libimlabel/Formats/NativeJSON.h>
#include <libimlabel/Formats/PascalVOC.h>
#include <libimlabel/Platform/Config.h>
#include <libimlabel/Platform/Log.h>
#include <libimlabel/Platform/LogLevel.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace iml;

namespace
{
    constexpr std::string_view c_usage = "usage: imlabel-convert [--help] [--config FILE] [--log-level LEVEL] (PROJECT.json | IMAGE_DIR) (--coco OUT.json | --voc DIR | --native DIR)...\n";

    constexpr std::string_view c_help = R"(INPUT
    PROJECT.json
        A project file (master dataset)
    IMAGE_DIR
        A folder of images, along with any <stem>_annotations.json files beside them

OPTIONS
    --help
        Show this help
    --config FILE
        Load configuration from FILE, rather than searching for imlabel.toml
    --log-level LEVEL
        Only log messages at LEVEL or above (trace, debug, info, warning, error, critical, off)
    --coco OUT.json
        Export the project as a COCO document
    --voc DIR
        Export the project as Pascal VOC documents, written into DIR/Annotations/
    --native DIR
        Export one native JSON annotation document per image into DIR
)";

    enum class ExportKind { COCO, PascalVOC, Native };

    struct ExportRequest final {
        ExportKind kind;
        std::filesystem::path destination;
    };

    void run_export(const ExportRequest& request, const Project& project, const Config& config)
    {
        switch (request.kind) {
        case ExportKind::COCO:
            export_coco_file(request.destination, project, config.approximation_policy());
            break;
        case ExportKind::PascalVOC:
            export_pascal_voc_files(request.destination, project, config.pascal_voc_parameters());
            break;
        case ExportKind::Native:
            export_native_annotation_files(request.destination, project, ExportMetadata{}, config.default_label_color());
            break;
        }
    }

    Project load_input(const std::filesystem::path& input, const Config& config)
    {
        if (not std::filesystem::is_directory(input)) {
            return load_project_file(input, config.default_label_color());
        }

        Project rv = load_image_folder(input);
        const AnnotationFilesLoadResult result = load_image_annotation_files(rv, config.default_label_color());
        if (not result.failed.empty()) {
            throw std::runtime_error{input.string() + ": " + std::to_string(result.failed.size()) + " annotation file(s) could not be loaded"};
        }
        return rv;
    }
}

int main(int argc, char* argv[])
{
    std::vector<std::string_view> unnamed_args;
    std::vector<ExportRequest> requests;
    std::optional<std::filesystem::path> config_path;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        // returns the argument that follows `arg`, or nothing if there isn't one
        const auto next_arg = [&]() -> std::optional<std::string_view>
        {
            if (i + 1 >= argc) {
                std::cerr << "imlabel-convert: " << arg << ": requires an argument\n" << c_usage;
                return std::nullopt;
            }
            return std::string_view{argv[++i]};  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        };

        if (arg.empty()) {
            // do nothing (this shouldn't happen)
        }
        else if (arg.front() != '-') {
            unnamed_args.push_back(arg);
        }
        else if (arg == "--help") {
            std::cout << c_usage << '\n' << c_help << '\n';
            return EXIT_SUCCESS;
        }
        else if (arg == "--config") {
            const auto value = next_arg();
            if (not value) {
                return EXIT_FAILURE;
            }
            config_path = *value;
        }
        else if (arg == "--log-level") {
            const auto value = next_arg();
            if (not value) {
                return EXIT_FAILURE;
            }
            const std::optional<LogLevel> level = try_parse_as_log_level(*value);
            if (not level) {
                std::cerr << "imlabel-convert: " << *value << ": unknown log level\n";
                return EXIT_FAILURE;
            }
            set_log_level(*level);
        }
        else if (arg == "--coco" or arg == "--voc" or arg == "--native") {
            const auto value = next_arg();
            if (not value) {
                return EXIT_FAILURE;
            }
            const ExportKind kind = arg == "--coco" ? ExportKind::COCO : (arg == "--voc" ? ExportKind::PascalVOC : ExportKind::Native);
            requests.push_back(ExportRequest{kind, std::filesystem::path{*value}});
        }
        else {
            std::cerr << "imlabel-convert: " << arg << ": unknown option\n" << c_usage;
            return EXIT_FAILURE;
        }
    }

    if (unnamed_args.size() != 1 or requests.empty()) {
        std::cerr << c_usage;
        return EXIT_FAILURE;
    }

    try {
        const Config config = config_path ? Config::load(*config_path) : Config::load();
        const Project project = load_input(std::filesystem::path{unnamed_args.front()}, config);
        for (const ExportRequest& request : requests) {
            run_export(request, project, config);
        }
    }
    catch (const std::exception& ex) {
        log_error("%s", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
