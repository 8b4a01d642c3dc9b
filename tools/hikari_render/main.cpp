#include <hikari/core/config.h>
#include <hikari/core/log.h>
#include <hikari/core/time.h>
#include <hikari/image/image.h>
#include <hikari/image/ppm.h>
#include <hikari/renderer/renderer.h>
#include <hikari/scene/scene.h>
#include <hikari/scene/scene_loader.h>
#include <CLI/CLI.hpp>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <string>
#include <utility>

using namespace hikari;

/**
 * Render tool
 *
 * Renders a built-in preset or a JSON scene file to a PPM image. Values from
 * the config file are overridden by the command line.
 */
int main(int argc, char** argv) {
    CLI::App app{"hikari_render - CPU path tracer"};

    std::filesystem::path configPath = "data/config/render.json";
    std::filesystem::path scenePath;
    std::string preset;
    std::filesystem::path outputPath;
    int width = 0;
    int height = 0;
    int samples = 0;
    int depth = 0;
    uint64_t seed = 0;
    unsigned threads = 0;
    bool binary = false;
    std::string logLevel;

    app.add_option("--config", configPath, "Path to the JSON render config");
    app.add_option("--scene", scenePath, "Path to a JSON scene description")
        ->check(CLI::ExistingFile);
    app.add_option("--preset", preset, "Built-in scene: three_spheres, random_spheres, "
                                       "random_spheres_static or cornell_box");
    app.add_option("-o,--output", outputPath, "Output PPM path");
    auto* widthOpt = app.add_option("--width", width, "Image width in pixels")->check(CLI::PositiveNumber);
    auto* heightOpt = app.add_option("--height", height, "Image height in pixels")->check(CLI::PositiveNumber);
    auto* samplesOpt = app.add_option("--spp", samples, "Samples per pixel")->check(CLI::PositiveNumber);
    auto* depthOpt = app.add_option("--depth", depth, "Maximum bounce depth")->check(CLI::NonNegativeNumber);
    auto* seedOpt = app.add_option("--seed", seed, "Random seed");
    auto* threadsOpt = app.add_option("--threads", threads, "Worker threads, 0 for one per hardware thread");
    app.add_flag("--binary", binary, "Write binary P6 instead of plain P3");
    app.add_option("--log-level", logLevel, "trace, debug, info, warn, error or critical");

    CLI11_PARSE(app, argc, argv);

    config::Overrides overrides;
    if (*widthOpt) overrides.width = width;
    if (*heightOpt) overrides.height = height;
    if (*samplesOpt) overrides.samples_per_pixel = samples;
    if (*depthOpt) overrides.max_depth = depth;
    if (*seedOpt) overrides.seed = seed;
    if (*threadsOpt) overrides.threads = threads;
    overrides.output_binary = binary;
    if (!outputPath.empty()) overrides.output_path = outputPath;
    if (!preset.empty()) overrides.scene_preset = preset;
    if (!scenePath.empty()) overrides.scene_file = scenePath;
    if (!logLevel.empty()) overrides.log_level = logLevel;

    try {
        auto appConfig = config::load_from_file(configPath);
        config::apply_overrides(appConfig, overrides);
        log::init(appConfig.log_level);

        const auto settings = scene::MakeRenderSettings(appConfig);

        // Scene construction draws from its own stream so BVH layout and
        // preset contents do not depend on the render
        math::Rng sceneRng = math::Rng::ForStream(appConfig.seed, UINT64_MAX);

        time::Stopwatch total;
        auto loaded = scene::LoadConfiguredScene(appConfig, settings.AspectRatio(), sceneRng);
        if (!loaded) {
            HIKARI_LOG_CRITICAL("{}", loaded.GetError().Describe());
            return 1;
        }
        const scene::Scene loadedScene = std::move(loaded).Unwrap();

        const auto pixels = scene::RenderScene(loadedScene, settings);
        const auto raster = image::Quantize(pixels);

        const auto format = appConfig.output_binary ? image::PpmFormat::Binary : image::PpmFormat::Plain;
        if (auto written = image::WritePpm(appConfig.output_path, raster, format); !written) {
            HIKARI_LOG_CRITICAL("{}", written.GetError().Describe());
            return 1;
        }

        HIKARI_LOG_INFO("Done in {:.2f} s", total.elapsed_seconds());
        return 0;

    } catch (const std::exception& e) {
        HIKARI_LOG_CRITICAL("{}", e.what());
        return 1;
    }
}
