#pragma once

#include "lmbridge/common/errors.h"
#include "lmbridge/service/inference_service.h"
#include "lmbridge/transport/event_loop.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace lmbridge {
namespace test {

// What a test can observe of (and control in) the fake it spawns
struct FakeControl {
    std::atomic<int> created{0};
    std::atomic<int> destroyed{0};
    std::atomic<int> init_calls{0};
    std::atomic<int> cancelled{0};
    std::atomic<bool> fail_construction{false};

    // loadEmbedding stays pending until the test settles this
    Promise<void> gate;

    std::mutex mutex;
    std::thread::id created_on;
    std::thread::id destroyed_on;
    std::vector<std::string> calls;

    void record(const std::string& call) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(call);
    }
};

// Scripted engine. Asynchronous results and stream elements are produced on
// its own job thread, like a real runtime.
//   embed("hello")       -> [0.1, 0.2] right away
//   embed("")            -> failed future without a message
//   embed(text)          -> [text.size()], later for shorter texts
//   completion("hi")     -> "He", "llo"
//   completion("fail")   -> "a", then an error
//   completion("endless")-> ticks until cancelled
//   completion("silent") -> "a", then an error without a message
//   setImage             -> throws
//   setAudio             -> failed future
class FakeService : public InferenceService {
public:
    explicit FakeService(std::shared_ptr<FakeControl> control)
        : control_(std::move(control))
        , jobs_(std::make_shared<EventLoop>("fake.jobs")) {
        if (control_->fail_construction) {
            throw std::runtime_error("model file missing");
        }
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->created_on = std::this_thread::get_id();
        }
        ++control_->created;
        jobs_->start();
    }

    ~FakeService() override {
        jobs_->stop();
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            control_->destroyed_on = std::this_thread::get_id();
        }
        ++control_->destroyed;
    }

    static ServiceFactory factory(std::shared_ptr<FakeControl> control) {
        return [control]() -> std::unique_ptr<InferenceService> {
            return std::unique_ptr<InferenceService>(new FakeService(control));
        };
    }

    Future<void> init(const InitParam&) override {
        ++control_->init_calls;
        return makeReadyFuture();
    }

    Future<void> initRuntime(const InitRuntimeParam& param) override {
        control_->record("initRuntime:" + param.model_path);
        Promise<void> promise;
        bool fail = param.model_path.empty();
        jobs_->postDelayed(std::chrono::milliseconds(10), [promise, fail]() mutable {
            if (fail) {
                promise.setException(std::make_exception_ptr(BridgeError("model path is empty")));
            } else {
                promise.setValue();
            }
        });
        return promise.getFuture();
    }

    Future<void> loadEmbedding(const std::string& path) override {
        control_->record("loadEmbedding:" + path);
        return control_->gate.getFuture();
    }

    Future<std::vector<float>> embed(const std::string& text) override {
        if (text == "hello") {
            return makeReadyFuture(std::vector<float>{0.1f, 0.2f});
        }
        if (text.empty()) {
            return makeFailedFuture<std::vector<float>>(
                std::make_exception_ptr(std::runtime_error("")));
        }
        Promise<std::vector<float>> promise;
        int delay_ms = std::max(0, 60 - 10 * static_cast<int>(text.size()));
        float value = static_cast<float>(text.size());
        jobs_->postDelayed(std::chrono::milliseconds(delay_ms), [promise, value]() mutable {
            promise.setValue(std::vector<float>{value});
        });
        return promise.getFuture();
    }

    Future<float> similarity(const SimilarityParam& param) override {
        if (param.a.size() != param.b.size()) {
            return makeFailedFuture<float>(
                std::make_exception_ptr(std::invalid_argument("size mismatch")));
        }
        return makeReadyFuture(static_cast<float>(param.a.size()));
    }

    Future<void> setSamplerParam(const SamplerParam& param) override {
        control_->record("setSamplerParam:" + std::to_string(param.top_k));
        return makeReadyFuture();
    }

    Future<void> setPenaltyParam(const PenaltyParam&) override {
        control_->record("setPenaltyParam");
        return makeReadyFuture();
    }

    Stream<std::string> completion(const std::string& prompt) override {
        StreamController<std::string> out;
        if (prompt == "hi") {
            produce(out, {"He", "llo"}, nullptr);
        } else if (prompt == "fail") {
            produce(out, {"a"}, std::make_exception_ptr(std::runtime_error("generation failed")));
        } else if (prompt == "silent") {
            produce(out, {"a"}, std::make_exception_ptr(std::runtime_error("")));
        } else if (prompt == "endless") {
            std::shared_ptr<FakeControl> control = control_;
            out.setOnCancel([control] { ++control->cancelled; });
            tick(out, 0);
        } else {
            produce(out, {prompt}, nullptr);
        }
        return out.stream();
    }

    Stream<std::string> chat(const std::vector<std::string>& history) override {
        StreamController<std::string> out;
        produce(out, history, nullptr);
        return out.stream();
    }

    Future<TextGenerationState> getGenerationState() override {
        return makeReadyFuture(TextGenerationState().copyWith(false, 1.0, 100.0, 42.0));
    }

    Future<void> setGenerationParam(const GenerationParam& param) override {
        control_->record("setGenerationParam:" + std::to_string(param.max_tokens));
        return makeReadyFuture();
    }

    Future<void> setImage(const std::string&) override {
        throw std::runtime_error("image input unsupported");
    }

    Future<void> setAudio(const std::string&) override {
        return makeFailedFuture<void>(
            std::make_exception_ptr(std::runtime_error("audio input unsupported")));
    }

    Future<void> clearState() override {
        control_->record("clearState");
        return makeReadyFuture();
    }

    Future<void> stop() override {
        control_->record("stop");
        return makeReadyFuture();
    }

private:
    void produce(StreamController<std::string> out, std::vector<std::string> items,
                 std::exception_ptr error) {
        jobs_->post([out, items, error]() mutable {
            for (const auto& item : items) {
                out.add(item);
            }
            if (error) {
                out.addError(error);
            } else {
                out.close();
            }
        });
    }

    void tick(StreamController<std::string> out, int n) {
        jobs_->postDelayed(std::chrono::milliseconds(5), [this, out, n]() mutable {
            if (out.isCancelled()) {
                return;
            }
            out.add("tick" + std::to_string(n));
            tick(out, n + 1);
        });
    }

    std::shared_ptr<FakeControl> control_;
    std::shared_ptr<EventLoop> jobs_;
};

} // namespace test
} // namespace lmbridge
