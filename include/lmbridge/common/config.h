#pragma once

#include <string>
#include <cstdint>

namespace lmbridge {

// Proxy/worker bridge configuration
struct BridgeConfig {
    // Handshake
    int handshake_timeout_ms;               // Max wait for the worker's bootstrap reply

    // Admission control
    int max_in_flight;                      // Calls the worker keeps in flight (0 = unbounded)

    // Execution contexts
    std::string proxy_name;                 // Name of the proxy reply loop (used in logs)
    std::string worker_name;                // Name of the worker loop (used in logs)

    // Logging
    bool verbose;                           // Enable verbose logging
    std::string log_file;                   // Log file path (empty = stdout)

    // Default constructor with reasonable defaults
    BridgeConfig()
        : handshake_timeout_ms(5000)
        , max_in_flight(0)
        , proxy_name("proxy")
        , worker_name("worker")
        , verbose(false)
        , log_file("")
    {}
};

// llama.cpp runtime configuration
struct RuntimeConfig {
    // Model configuration
    int n_gpu_layers;                       // Number of layers to offload to GPU (-1 = all)
    int n_ctx;                              // Context size (max sequence length)
    int n_batch;                            // Logical batch size for prompt processing
    int embedding_n_ctx;                    // Context size of the embedding model

    // Performance tuning
    int num_threads;                        // CPU threads for computation
    bool use_mmap;                          // Use mmap for model loading
    bool use_mlock;                         // Lock model in RAM

    // Sampling
    uint32_t seed;                          // Seed of the final distribution sampler

    RuntimeConfig()
        : n_gpu_layers(-1)
        , n_ctx(4096)
        , n_batch(512)
        , embedding_n_ctx(512)
        , num_threads(4)
        , use_mmap(true)
        , use_mlock(false)
        , seed(0xFFFFFFFFu)
    {}
};

} // namespace lmbridge
