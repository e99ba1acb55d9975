#include <ganttgen/core/error.hpp>
#include <ganttgen/io/chart_loader.hpp>
#include <ganttgen/io/error.hpp>
#include <ganttgen/io/log_sinks.hpp>
#include <ganttgen/io/svg_writer.hpp>
#include <ganttgen/layout/layout_engine.hpp>
#include <ganttgen/layout/scene_builder.hpp>

#include <cxxopts.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <random>
#include <string>

namespace {

namespace core = ganttgen::core;
namespace io = ganttgen::io;
namespace layout = ganttgen::layout;

struct Config {
    std::string input_file;   // empty: stdin
    std::string output_file;  // empty: stdout
    layout::LayoutOptions layout;
    bool resource_table{false};
    std::optional<uint32_t> seed;
    bool verbose{false};
};

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("ganttgen", "Gantt chart SVG generator");

    options.add_options()
        ("input-file", "Chart description (JSON, default: stdin)", cxxopts::value<std::string>())
        ("output-file", "SVG output (default: stdout)", cxxopts::value<std::string>())
        ("t,title-width", "Width of the task title column (default: 210)",
         cxxopts::value<double>()->default_value("210"))
        ("m,max-month-width", "Width of a 31-day month column (default: 80)",
         cxxopts::value<double>()->default_value("80"))
        ("a,add-resource-table", "Draw a resource legend below the chart")
        ("seed", "Seed for resource colors (default: random)", cxxopts::value<uint32_t>())
        ("v,verbose", "Print a layout summary to stderr")
        ("version", "Print version and exit")
        ("h,help", "Show help");

    options.parse_positional({"input-file", "output-file"});
    options.positional_help("[INPUT_FILE] [OUTPUT_FILE]");

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("version") != 0U) {
        std::cout << "ganttgen " << GANTTGEN_VERSION << std::endl;
        std::exit(0);
    }

    Config config;
    if (result.count("input-file") != 0U) {
        config.input_file = result["input-file"].as<std::string>();
    }
    if (result.count("output-file") != 0U) {
        config.output_file = result["output-file"].as<std::string>();
    }
    config.layout.title_width = result["title-width"].as<double>();
    config.layout.max_month_width = result["max-month-width"].as<double>();
    config.resource_table = result.count("add-resource-table") != 0U;
    if (result.count("seed") != 0U) {
        config.seed = result["seed"].as<uint32_t>();
    }
    config.verbose = result.count("verbose") != 0U;

    return config;
}

std::mt19937 make_rng(const Config& config) {
    if (config.seed) {
        return std::mt19937{*config.seed};
    }
    std::random_device device;
    return std::mt19937{device()};
}

} // anonymous namespace

int main(int argc, char** argv) {
    // Summary lines are discarded unless --verbose
    std::ostream discard(nullptr);
    io::StreamLogSink sink(discard, std::cerr);

    try {
        auto config = parse_args(argc, argv);

        std::ostream& info = config.verbose ? std::cerr : discard;
        io::StreamLogSink log(info, std::cerr);

        auto chart = config.input_file.empty() ? io::load_chart_from_stream(std::cin)
                                               : io::load_chart(config.input_file);

        layout::LayoutEngine engine{config.layout};
        engine.set_log_sink(&log);

        auto rng = make_rng(config);
        auto geometry = engine.compute(chart, rng);
        auto document = layout::build_scene(geometry, layout::SceneOptions{config.resource_table});

        if (config.output_file.empty()) {
            io::write_svg(document, std::cout);
            std::cout.flush();
        } else {
            io::write_svg_file(document, config.output_file);
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        sink.error(e.what());
        return 1;
    }
    catch (const core::InvalidOptionError& e) {
        sink.error(std::string("invalid option: ") + e.what());
        return 64;
    }
    catch (const core::ChartError& e) {
        sink.error(std::string("invalid chart: ") + e.what());
        return 1;
    }
    catch (const cxxopts::exceptions::exception& e) {
        sink.error(std::string("invalid arguments: ") + e.what());
        return 64;
    }
    catch (const std::exception& e) {
        sink.error(e.what());
        return 1;
    }
}
