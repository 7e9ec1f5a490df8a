#include "config.hpp"
#include "error.hpp"
#include "inference/collect.hpp"
#include "serialize.hpp"
#include "util.hpp"
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>

static switchyard::CancellationToken g_cancel;

static void signal_handler(int /*sig*/) {
    g_cancel.cancel();
}

static void print_usage() {
    std::cout << "Usage: switchyard [options]\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Gateway config file (JSON)\n"
              << "  -f, --function NAME  Function to call\n"
              << "  -v, --variant NAME   Variant to use (default: sampled by weight)\n"
              << "  -i, --input JSON     Input, e.g. {\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}]}\n"
              << "  --stream             Stream the response, one JSON chunk per line\n"
              << "  --validate           Only load and validate the config\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  SWITCHYARD_CONFIG    Config file used when --config is not given\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string function_name;
    std::string variant_name;
    std::string input_json;
    bool stream = false;
    bool validate_only = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-f") == 0 || std::strcmp(argv[i], "--function") == 0) && i + 1 < argc) {
            function_name = argv[++i];
        } else if ((std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--variant") == 0) && i + 1 < argc) {
            variant_name = argv[++i];
        } else if ((std::strcmp(argv[i], "-i") == 0 || std::strcmp(argv[i], "--input") == 0) && i + 1 < argc) {
            input_json = argv[++i];
        } else if (std::strcmp(argv[i], "--stream") == 0) {
            stream = true;
        } else if (std::strcmp(argv[i], "--validate") == 0) {
            validate_only = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (config_path.empty()) {
        const char* env = std::getenv("SWITCHYARD_CONFIG");
        if (env) config_path = env;
    }
    if (config_path.empty()) {
        std::cerr << "Error: no config file (use --config or SWITCHYARD_CONFIG)\n";
        return 1;
    }

    auto config = switchyard::Config::load(config_path);
    config.validate();
    if (validate_only) {
        std::cout << "Config OK: " << config.functions.size() << " functions, "
                  << config.models.names().size() << " models\n";
        return 0;
    }

    const switchyard::FunctionConfig* function = config.function(function_name);
    if (!function) {
        std::cerr << "Error: unknown function: " << function_name << "\n";
        return 1;
    }
    if (variant_name.empty()) {
        std::mt19937_64 rng(std::random_device{}());
        variant_name = function->sample_variant(rng);
    }
    const switchyard::VariantConfig* variant = function->variant(variant_name);
    if (!variant) {
        std::cerr << "Error: unknown variant: " << variant_name << "\n";
        return 1;
    }

    switchyard::Input input = switchyard::input_from_json(
        input_json.empty() ? nlohmann::json{{"messages", nlohmann::json::array()}}
                           : nlohmann::json::parse(input_json));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    switchyard::InferenceContext ctx;
    ctx.inference_id = switchyard::generate_inference_id();
    ctx.function_name = function_name;
    ctx.variant_name = variant_name;
    ctx.templates = config.templates;
    ctx.cancel = g_cancel;

    try {
        if (stream) {
            auto result_stream = variant->infer_stream(input, config.models, *function, ctx);
            std::cout << switchyard::chunk_to_json(result_stream.first_chunk).dump() << "\n";
            std::vector<switchyard::InferenceResultChunk> rest;
            while (auto chunk = result_stream.rest->next()) {
                std::cout << switchyard::chunk_to_json(*chunk).dump() << "\n";
                rest.push_back(std::move(*chunk));
            }
            result_stream.rest =
                std::make_unique<switchyard::VectorChunkStream<switchyard::InferenceResultChunk>>(
                    std::move(rest));
            auto result = switchyard::collect_stream(std::move(result_stream), *function, ctx);
            std::cout << switchyard::result_to_json(result).dump(2) << "\n";
        } else {
            auto result = variant->infer(input, config.models, *function, ctx);
            std::cout << switchyard::result_to_json(result).dump(2) << "\n";
        }
    } catch (const switchyard::Error& e) {
        std::cerr << switchyard::error_to_json(e).dump(2) << "\n";
        return 1;
    }
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
