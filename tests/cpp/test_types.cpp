#include <gtest/gtest.h>
#include "lmbridge/common/errors.h"
#include "lmbridge/common/types.h"

using namespace lmbridge;

TEST(BackendTest, ParseIsCaseInsensitiveSubstring) {
    EXPECT_EQ(parseBackend("llama.cpp"), Backend::LlamaCpp);
    EXPECT_EQ(parseBackend("LLAMA"), Backend::LlamaCpp);
    EXPECT_EQ(parseBackend("ncnn"), Backend::Ncnn);
    EXPECT_EQ(parseBackend("web-rwkv"), Backend::WebRwkv);
    EXPECT_EQ(parseBackend("WebRWKV"), Backend::WebRwkv);
    EXPECT_EQ(parseBackend("qnn"), Backend::Qnn);
    EXPECT_EQ(parseBackend("CoreML"), Backend::CoreMl);
}

TEST(BackendTest, FirstMatchWins) {
    // "ncnn" is checked before "mnn"
    EXPECT_EQ(parseBackend("mnn"), Backend::Mnn);
    EXPECT_EQ(parseBackend("ncnn-mnn"), Backend::Ncnn);
}

TEST(BackendTest, UnknownBackend) {
    EXPECT_THROW(parseBackend("onnx"), ConfigError);
    EXPECT_THROW(parseBackend(""), ConfigError);
    EXPECT_THROW(parseBackend("rwkv"), ConfigError);
}

TEST(BackendTest, ArgumentRoundTrip) {
    for (Backend backend : {Backend::Ncnn, Backend::LlamaCpp, Backend::WebRwkv,
                            Backend::Qnn, Backend::Mnn, Backend::CoreMl}) {
        EXPECT_EQ(parseBackend(backendArgument(backend)), backend);
    }
}

TEST(ParamTest, InitialValues) {
    SamplerParam sampler = SamplerParam::initial();
    EXPECT_FLOAT_EQ(sampler.temperature, 1.0f);
    EXPECT_EQ(sampler.top_k, 1);
    EXPECT_FLOAT_EQ(sampler.top_p, 0.5f);

    PenaltyParam penalty = PenaltyParam::initial();
    EXPECT_FLOAT_EQ(penalty.presence_penalty, 0.5f);
    EXPECT_FLOAT_EQ(penalty.frequency_penalty, 0.5f);
    EXPECT_FLOAT_EQ(penalty.penalty_decay, 0.996f);

    GenerationParam generation = GenerationParam::initial();
    EXPECT_EQ(generation.max_tokens, 2000);
    EXPECT_FALSE(generation.chat_reasoning);
    EXPECT_EQ(generation.completion_stop_token, 0);
    EXPECT_EQ(generation.thinking_token, "");
    EXPECT_EQ(generation.prompt, "<EOD>");

    InitParam init;
    EXPECT_EQ(init.dynamic_lib_dir, "");
    EXPECT_EQ(init.log_level, RuntimeLogLevel::Debug);

    TextGenerationState state = TextGenerationState::initial();
    EXPECT_FALSE(state.is_generating);
    EXPECT_DOUBLE_EQ(state.prefill_progress, 0.0);
    EXPECT_EQ(state.timestamp, 0);
}

TEST(ParamTest, CopyWithOverridesOnlyGivenFields) {
    GenerationParam base = GenerationParam::initial();
    GenerationParam copy = base.copyWith(128, true, std::string(GenerationParam::kThinkingTokenFree));
    EXPECT_EQ(copy.max_tokens, 128);
    EXPECT_TRUE(copy.chat_reasoning);
    EXPECT_EQ(copy.thinking_token, "<think>");
    EXPECT_EQ(copy.completion_stop_token, base.completion_stop_token);
    EXPECT_EQ(copy.prompt, base.prompt);

    TextGenerationState state = TextGenerationState().copyWith(true, 0.5);
    EXPECT_TRUE(state.is_generating);
    EXPECT_DOUBLE_EQ(state.prefill_progress, 0.5);
    EXPECT_DOUBLE_EQ(state.decode_speed, 0.0);
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
