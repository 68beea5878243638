#include "lmbridge/common/utils.h"
#include "lmbridge/runtime/llama_runtime.h"
#include "lmbridge/service/service_proxy.h"
#include <iostream>
#include <string>
#include <vector>

using namespace lmbridge;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <model_path>" << std::endl;
        return 1;
    }

    utils::Logger::getInstance().setLogLevel(utils::LogLevel::INFO);

    RuntimeConfig runtime_config;
    runtime_config.n_ctx = 2048;

    // The model lives on the worker thread; this thread only reads stdin
    ServiceProxy proxy([runtime_config]() -> std::unique_ptr<InferenceService> {
        return std::unique_ptr<InferenceService>(new LlamaRuntime(runtime_config));
    });

    try {
        InitParam init_param;
        init_param.log_level = RuntimeLogLevel::Warning;
        proxy.init(init_param).get();
        proxy.initRuntime(InitRuntimeParam(argv[1], "", Backend::LlamaCpp)).get();
        proxy.setSamplerParam(SamplerParam(0.7f, 40, 0.9f)).get();
        proxy.setGenerationParam(GenerationParam::initial().copyWith(
            512, false, std::string(GenerationParam::kThinkingTokenNone), 0,
            std::string(GenerationParam::kPromptNoThinkingEN))).get();
    } catch (const std::exception& e) {
        utils::Logger::getInstance().error(e.what());
        return 1;
    }

    std::vector<std::string> history;
    std::string line;
    std::cout << "> " << std::flush;
    while (std::getline(std::cin, line)) {
        if (line == "/quit") {
            break;
        }
        if (line == "/reset") {
            history.clear();
            proxy.clearState().get();
            std::cout << "> " << std::flush;
            continue;
        }

        history.push_back(line);
        std::string answer;
        try {
            Stream<std::string> output = proxy.chat(history);
            std::string piece;
            while (output.next(piece)) {
                std::cout << piece << std::flush;
                answer += piece;
            }
        } catch (const std::exception& e) {
            utils::Logger::getInstance().error(e.what());
        }
        history.push_back(answer);

        TextGenerationState state = proxy.getGenerationState().get();
        std::cout << "\n[" << utils::format("%.1f tok/s", state.decode_speed) << "]\n> " << std::flush;
    }

    return 0;
}
