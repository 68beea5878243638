#include "lmbridge/common/config.h"
#include "lmbridge/common/errors.h"
#include "lmbridge/common/utils.h"
#include "lmbridge/runtime/llama_runtime.h"
#include "lmbridge/service/inference_service.h"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using namespace lmbridge;

void printUsage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " <model_path> [options]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --tokenizer <path>       - Tokenizer path (unused by GGUF models)\n";
    std::cout << "  --backend <name>         - Backend (default: llama.cpp)\n";
    std::cout << "  --prompt <text>          - Input prompt\n";
    std::cout << "  --chat                   - Treat the prompt as a single-turn chat\n";
    std::cout << "  --max-tokens <n>         - Maximum output tokens (default: 256)\n";
    std::cout << "  --embedding-model <path> - Embed the prompt with this model as well\n";
    std::cout << "  --n-gpu-layers <n>       - Number of GPU layers (default: -1 = all)\n";
    std::cout << "  --local                  - Run the engine on the calling thread\n";
    std::cout << "  --verbose                - Enable verbose logging\n";
    std::cout << "  --log-file <path>        - Append log lines to a file\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string model_path = argv[1];

    // Parse options
    std::string tokenizer_path;
    std::string backend_name = "llama.cpp";
    std::string prompt = "Once upon a time";
    std::string embedding_model;
    bool chat = false;
    bool local = false;
    int max_tokens = 256;
    int n_gpu_layers = -1;

    BridgeConfig bridge_config;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--tokenizer" && i + 1 < argc) {
            tokenizer_path = argv[++i];
        } else if (arg == "--backend" && i + 1 < argc) {
            backend_name = argv[++i];
        } else if (arg == "--prompt" && i + 1 < argc) {
            prompt = argv[++i];
        } else if (arg == "--chat") {
            chat = true;
        } else if (arg == "--max-tokens" && i + 1 < argc) {
            max_tokens = std::stoi(argv[++i]);
        } else if (arg == "--embedding-model" && i + 1 < argc) {
            embedding_model = argv[++i];
        } else if (arg == "--n-gpu-layers" && i + 1 < argc) {
            n_gpu_layers = std::stoi(argv[++i]);
        } else if (arg == "--local") {
            local = true;
        } else if (arg == "--verbose") {
            bridge_config.verbose = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            bridge_config.log_file = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Setup logging
    if (bridge_config.verbose) {
        utils::Logger::getInstance().setLogLevel(utils::LogLevel::DEBUG);
    }
    if (!bridge_config.log_file.empty() &&
        !utils::Logger::getInstance().setLogFile(bridge_config.log_file)) {
        std::cerr << "Cannot open log file: " << bridge_config.log_file << std::endl;
        return 1;
    }

    Backend backend = Backend::LlamaCpp;
    try {
        backend = parseBackend(backend_name);
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    utils::Logger::getInstance().info("lmbridge - isolated inference service");
    utils::Logger::getInstance().info("=====================================");
    utils::Logger::getInstance().info(utils::format("Model: %s", model_path.c_str()));
    utils::Logger::getInstance().info(utils::format("Backend: %s", backendArgument(backend).c_str()));
    utils::Logger::getInstance().info(utils::format("Mode: %s", local ? "local" : "isolated"));

    RuntimeConfig runtime_config;
    runtime_config.n_gpu_layers = n_gpu_layers;

    ServiceFactory factory = [runtime_config]() -> std::unique_ptr<InferenceService> {
        return std::unique_ptr<InferenceService>(new LlamaRuntime(runtime_config));
    };

    try {
        std::unique_ptr<InferenceService> service = local
            ? createLocalService(factory)
            : createIsolatedService(factory, bridge_config);

        InitParam init_param;
        init_param.log_level = bridge_config.verbose ? RuntimeLogLevel::Debug : RuntimeLogLevel::Info;
        service->init(init_param).get();
        service->initRuntime(InitRuntimeParam(model_path, tokenizer_path, backend)).get();
        service->setGenerationParam(GenerationParam::initial().copyWith(max_tokens)).get();

        auto start = std::chrono::steady_clock::now();
        Stream<std::string> output = chat
            ? service->chat(std::vector<std::string>{prompt})
            : service->completion(prompt);

        size_t pieces = 0;
        std::string piece;
        while (output.next(piece)) {
            std::cout << piece << std::flush;
            ++pieces;
        }
        std::cout << std::endl;
        auto end = std::chrono::steady_clock::now();

        TextGenerationState state = service->getGenerationState().get();
        utils::Logger::getInstance().info(
            utils::format("Generated %zu pieces in %.2f ms (decode %.2f tok/s)",
                         pieces, utils::getElapsedMs(start, end), state.decode_speed)
        );

        if (!embedding_model.empty()) {
            service->loadEmbedding(embedding_model).get();
            std::vector<float> embedding = service->embed(prompt).get();
            float self_similarity = service->similarity(SimilarityParam(embedding, embedding)).get();
            utils::Logger::getInstance().info(
                utils::format("Embedding: %zu dimensions (self similarity %.3f)",
                             embedding.size(), self_similarity)
            );
        }
    } catch (const std::exception& e) {
        utils::Logger::getInstance().error(e.what());
        return 1;
    }

    utils::Logger::getInstance().info("Done!");

    return 0;
}
