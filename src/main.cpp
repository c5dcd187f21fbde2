// regionmap - Top-down map renderer for region save files
// main.cpp - Entry point

#include <regionmap/core/config.hpp>
#include <regionmap/core/logger.hpp>
#include <regionmap/rendering/rendering.hpp>
#include <regionmap/world/world.hpp>

#include <charconv>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

void print_usage(const char* program) {
    std::fprintf(stderr,
                 "regionmap %s\n"
                 "Usage: %s <start_chunk_x> <start_chunk_z> <end_chunk_x> <end_chunk_z> [output.png] [options]\n"
                 "\n"
                 "Options:\n"
                 "  --config <file>      JSON config file\n"
                 "  --chunks <dir>       Directory holding <rx>.<rz>.region.bin files\n"
                 "  --properties <file>  Block display properties JSON\n"
                 "  --scale <n>          Pixels per block (default 1)\n"
                 "  --threads <n>        Chunks rendered concurrently (default 1)\n"
                 "  --verbose            Debug logging\n"
                 "\n"
                 "Example: %s -2 -2 2 2\n"
                 "  Renders a 5x5 grid of chunks (160x160 pixels)\n",
                 VERSION, program, program);
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

struct Arguments {
    std::vector<int> coords;
    std::string output;
    std::string config_path;
    std::optional<std::string> chunks_directory;
    std::optional<std::string> properties_path;
    std::optional<int> scale;
    std::optional<int> threads;
    bool verbose = false;
};

std::optional<Arguments> parse_arguments(int argc, char* argv[]) {
    Arguments args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Missing value for %s\n", argv[i]);
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--config" || arg == "--chunks" || arg == "--properties") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            if (arg == "--config") {
                args.config_path = std::string(*value);
            } else if (arg == "--chunks") {
                args.chunks_directory = std::string(*value);
            } else {
                args.properties_path = std::string(*value);
            }
        } else if (arg == "--scale" || arg == "--threads") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            auto number = parse_int(*value);
            if (!number || *number < 1) {
                std::fprintf(stderr, "%s expects a positive integer\n", argv[i - 1]);
                return std::nullopt;
            }
            (arg == "--scale" ? args.scale : args.threads) = *number;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (args.coords.size() < 4) {
            auto number = parse_int(arg);
            if (!number) {
                std::fprintf(stderr, "Invalid chunk coordinate: %s\n", argv[i]);
                return std::nullopt;
            }
            args.coords.push_back(*number);
        } else if (args.output.empty()) {
            args.output = std::string(arg);
        } else {
            std::fprintf(stderr, "Unexpected argument: %s\n", argv[i]);
            return std::nullopt;
        }
    }

    if (args.coords.size() != 4) {
        return std::nullopt;
    }
    if (args.output.empty()) {
        args.output = fmt::format("map_{}_{}_to_{}_{}.png", args.coords[0], args.coords[1], args.coords[2],
                                  args.coords[3]);
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace regionmap;

    auto args = parse_arguments(argc, argv);
    if (!args) {
        print_usage(argc > 0 ? argv[0] : "regionmap");
        return 1;
    }

    core::Config config;
    if (!args->config_path.empty() && !config.load(args->config_path)) {
        return 1;
    }

    // Command line overrides config
    if (args->chunks_directory) {
        config.set_string(core::config_section::PATHS, core::config_key::CHUNKS_DIRECTORY, *args->chunks_directory);
    }
    if (args->properties_path) {
        config.set_string(core::config_section::PATHS, core::config_key::BLOCK_PROPERTIES, *args->properties_path);
    }
    if (args->scale) {
        config.set_int(core::config_section::RENDER, core::config_key::PIXELS_PER_BLOCK, *args->scale);
    }
    if (args->threads) {
        config.set_int(core::config_section::RENDER, core::config_key::THREADS, *args->threads);
    }
    if (args->verbose) {
        config.set_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "debug");
    }

    core::LoggerConfig logger_config;
    std::string level_name = config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info");
    if (auto level = core::parse_log_level(level_name)) {
        logger_config.console_level = *level;
    }
    logger_config.log_file = config.get_string(core::config_section::DEBUG, core::config_key::LOG_FILE);
    core::Logger::initialize(logger_config);
    if (!core::parse_log_level(level_name)) {
        REGIONMAP_LOG_WARN(core::log_category::CONFIG, "Unknown log level '{}', using info", level_name);
    }

    REGIONMAP_LOG_INFO(core::log_category::APP, "regionmap v{}", VERSION);

    // Display properties are optional; heuristics cover unknown blocks
    std::string properties_path =
        config.get_string(core::config_section::PATHS, core::config_key::BLOCK_PROPERTIES);
    rendering::BlockPropertyTable properties;
    if (!properties_path.empty()) {
        if (auto loaded = rendering::BlockPropertyTable::load(properties_path)) {
            properties = std::move(*loaded);
        } else {
            REGIONMAP_LOG_WARN(core::log_category::ASSETS, "Rendering with fallback colors only");
        }
    }

    auto options = rendering::load_render_options(config);
    if (!options) {
        print_usage(argc > 0 ? argv[0] : "regionmap");
        return 1;
    }

    rendering::Compositor compositor(properties);
    rendering::MapRenderer renderer(compositor, *options);
    world::RegionReader reader(config.get_string(core::config_section::PATHS, core::config_key::CHUNKS_DIRECTORY));

    rendering::RenderStats stats;
    rendering::RgbImage image = renderer.render_map(reader, world::ChunkPos(args->coords[0], args->coords[1]),
                                                    world::ChunkPos(args->coords[2], args->coords[3]), &stats);

    if (stats.rendered == 0) {
        REGIONMAP_LOG_WARN(core::log_category::APP, "No chunks found under {}", reader.get_directory().string());
    }

    bool written = rendering::write_png(args->output, image);

    core::Logger::shutdown();
    return written ? 0 : 1;
}
