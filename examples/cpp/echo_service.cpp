#include "lmbridge/common/errors.h"
#include "lmbridge/common/utils.h"
#include "lmbridge/service/inference_service.h"
#include "lmbridge/service/service_proxy.h"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

using namespace lmbridge;

// Toy engine: embeddings are letter histograms, generation echoes the prompt
// word by word
class EchoService : public InferenceService {
public:
    Future<void> init(const InitParam&) override {
        utils::Logger::getInstance().info("EchoService: init on worker thread");
        return makeReadyFuture();
    }

    Future<void> initRuntime(const InitRuntimeParam& param) override {
        model_ = param.model_path;
        return makeReadyFuture();
    }

    Future<void> loadEmbedding(const std::string&) override { return makeReadyFuture(); }

    Future<std::vector<float>> embed(const std::string& text) override {
        std::vector<float> histogram(26, 0.0f);
        for (char c : text) {
            if (c >= 'a' && c <= 'z') {
                histogram[c - 'a'] += 1.0f;
            }
        }
        return makeReadyFuture(histogram);
    }

    Future<float> similarity(const SimilarityParam& param) override {
        if (param.a.size() != param.b.size()) {
            return makeFailedFuture<float>(
                std::make_exception_ptr(BridgeError("embedding sizes differ")));
        }
        float dot = 0.0f;
        for (size_t i = 0; i < param.a.size(); ++i) {
            dot += param.a[i] * param.b[i];
        }
        return makeReadyFuture(dot);
    }

    Future<void> setSamplerParam(const SamplerParam&) override { return makeReadyFuture(); }
    Future<void> setPenaltyParam(const PenaltyParam&) override { return makeReadyFuture(); }

    Stream<std::string> completion(const std::string& prompt) override {
        StreamController<std::string> out;
        std::istringstream words(prompt);
        std::string word;
        while (words >> word) {
            out.add(word + " ");
        }
        out.close();
        return out.stream();
    }

    Stream<std::string> chat(const std::vector<std::string>& history) override {
        return completion(history.empty() ? std::string() : history.back());
    }

    Future<TextGenerationState> getGenerationState() override {
        return makeReadyFuture(TextGenerationState::initial());
    }

    Future<void> setGenerationParam(const GenerationParam&) override { return makeReadyFuture(); }

    Future<void> setImage(const std::string&) override {
        return makeFailedFuture<void>(std::make_exception_ptr(BridgeError("no vision support")));
    }

    Future<void> setAudio(const std::string&) override {
        return makeFailedFuture<void>(std::make_exception_ptr(BridgeError("no audio support")));
    }

    Future<void> clearState() override { return makeReadyFuture(); }
    Future<void> stop() override { return makeReadyFuture(); }

private:
    std::string model_;
};

int main() {
    utils::Logger::getInstance().setLogLevel(utils::LogLevel::INFO);

    BridgeConfig config;
    config.worker_name = "echo.worker";

    ServiceProxy proxy([]() -> std::unique_ptr<InferenceService> {
        return std::unique_ptr<InferenceService>(new EchoService());
    }, config);

    try {
        proxy.init(InitParam()).get();
        proxy.initRuntime(InitRuntimeParam("echo.bin", "", Backend::LlamaCpp)).get();

        // Several calls in flight at once; each reply finds its own caller
        std::vector<std::string> texts = {"hello", "world", "lmbridge"};
        std::vector<Future<std::vector<float>>> embeddings;
        for (const auto& text : texts) {
            embeddings.push_back(proxy.embed(text));
        }
        std::vector<float> first = embeddings[0].get();
        for (size_t i = 0; i < texts.size(); ++i) {
            float score = proxy.similarity(SimilarityParam(first, embeddings[i].get())).get();
            utils::Logger::getInstance().info(
                utils::format("similarity(%s, %s) = %.1f", texts[0].c_str(), texts[i].c_str(), score)
            );
        }

        Stream<std::string> output = proxy.completion("the quick brown fox");
        std::string piece;
        while (output.next(piece)) {
            std::cout << piece << std::flush;
        }
        std::cout << std::endl;

        try {
            proxy.setImage("cat.png").get();
        } catch (const RemoteError& e) {
            utils::Logger::getInstance().info(utils::format("setImage failed remotely: %s", e.what()));
        }
    } catch (const std::exception& e) {
        utils::Logger::getInstance().error(e.what());
        return 1;
    }

    return 0;
}
