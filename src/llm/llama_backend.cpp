#include "llm/llama_backend.hpp"

// llama.h pulls in ggml; keep it inside this translation unit.
#include <llama.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace replyd::llm {
namespace {

constexpr std::uint32_t kSamplerSeed = 0xC0FFEEU;
constexpr std::int32_t kPenaltyWindow = 64;

std::once_flag backend_once;

// The ggml backend is initialised once per process and outlives every model.
void backend_init() {
  std::call_once(backend_once, []() { llama_backend_init(); });
}

void batch_add(llama_batch& batch, const llama_token token, const llama_pos pos, const bool logits) {
  const std::int32_t i = batch.n_tokens;
  batch.token[i] = token;
  batch.pos[i] = pos;
  batch.n_seq_id[i] = 1;
  batch.seq_id[i][0] = 0;
  batch.logits[i] = logits;
  ++batch.n_tokens;
}

std::vector<llama_token> tokenize(const llama_vocab* vocab, const std::string& text) {
  std::int32_t count = llama_tokenize(vocab, text.c_str(), static_cast<std::int32_t>(text.size()), nullptr, 0, true, true);
  if (count < 0) {
    count = -count;
  }
  std::vector<llama_token> tokens(static_cast<std::size_t>(count));
  count = llama_tokenize(vocab, text.c_str(), static_cast<std::int32_t>(text.size()), tokens.data(),
                         static_cast<std::int32_t>(tokens.size()), true, true);
  if (count < 0) {
    throw std::runtime_error("tokenization failed");
  }
  tokens.resize(static_cast<std::size_t>(count));
  return tokens;
}

std::string token_to_piece(const llama_vocab* vocab, const llama_token token) {
  std::string out(64, '\0');
  std::int32_t n = llama_token_to_piece(vocab, token, out.data(), static_cast<std::int32_t>(out.size()), 0, false);
  if (n < 0) {
    out.resize(static_cast<std::size_t>(-n));
    n = llama_token_to_piece(vocab, token, out.data(), static_cast<std::int32_t>(out.size()), 0, false);
  }
  out.resize(n > 0 ? static_cast<std::size_t>(n) : 0U);
  return out;
}

// Returns the cut position of the earliest stop sequence, or npos.
std::size_t find_stop(const std::string& text, const std::vector<std::string>& stops) {
  std::size_t cut = std::string::npos;
  for (const auto& stop : stops) {
    if (stop.empty()) {
      continue;
    }
    const auto pos = text.find(stop);
    if (pos != std::string::npos) {
      cut = std::min(cut, pos);
    }
  }
  return cut;
}

class LlamaBackend final : public InferenceBackend {
 public:
  LlamaBackend(const std::string& model_path, const LoadProfile& profile) : profile_(profile) {
    backend_init();

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = profile.gpu_layers;
    model_params.use_mmap = profile.use_mmap;
    model_params.use_mlock = profile.use_mlock;

    model_ = llama_model_load_from_file(model_path.c_str(), model_params);
    if (model_ == nullptr) {
      throw ModelLoadError("failed to load model: " + model_path);
    }

    vocab_ = llama_model_get_vocab(model_);
    if (vocab_ == nullptr) {
      llama_model_free(model_);
      throw ModelLoadError("model has no vocabulary: " + model_path);
    }

    context_params_ = llama_context_default_params();
    context_params_.n_ctx = static_cast<std::uint32_t>(profile.context_size);
    context_params_.n_batch = static_cast<std::uint32_t>(profile.batch);
    context_params_.n_threads = profile.threads;
    context_params_.n_threads_batch = profile.threads;
  }

  ~LlamaBackend() override {
    llama_model_free(model_);
  }

  LlamaBackend(const LlamaBackend&) = delete;
  LlamaBackend& operator=(const LlamaBackend&) = delete;

  std::string infer(const std::string& prompt, const GenerationParams& params) override {
    const std::vector<llama_token> tokens = tokenize(vocab_, prompt);
    if (tokens.empty()) {
      throw std::runtime_error("prompt produced no tokens");
    }

    const auto n_ctx = static_cast<std::int32_t>(profile_.context_size);
    if (static_cast<std::int32_t>(tokens.size()) + params.max_tokens > n_ctx) {
      throw ContextWindowError("prompt of " + std::to_string(tokens.size()) + " tokens exceeds context window of " +
                               std::to_string(n_ctx) + " with " + std::to_string(params.max_tokens) + " reserved");
    }

    // A fresh context per request keeps the KV cache empty without relying
    // on version-specific memory APIs.
    ContextPtr context(llama_init_from_model(model_, context_params_));
    if (context == nullptr) {
      throw std::runtime_error("failed to create inference context");
    }
    SamplerPtr sampler(make_sampler(params));
    if (sampler == nullptr) {
      throw std::runtime_error("failed to create sampler");
    }

    const std::int32_t batch_size = std::max<std::int32_t>(1, profile_.batch);
    BatchGuard batch(llama_batch_init(batch_size, 0, 1));

    llama_pos pos = 0;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
      batch_add(batch.value, tokens[i], pos++, i + 1 == tokens.size());
      if (batch.value.n_tokens == batch_size || i + 1 == tokens.size()) {
        if (llama_decode(context.get(), batch.value) != 0) {
          throw std::runtime_error("prompt decode failed");
        }
        batch.value.n_tokens = 0;
      }
    }

    std::string out;
    for (std::int32_t i = 0; i < params.max_tokens && pos < n_ctx; ++i) {
      const llama_token token = llama_sampler_sample(sampler.get(), context.get(), -1);
      if (llama_vocab_is_eog(vocab_, token)) {
        break;
      }
      out += token_to_piece(vocab_, token);

      const auto cut = find_stop(out, params.stop);
      if (cut != std::string::npos) {
        out.resize(cut);
        break;
      }

      batch.value.n_tokens = 0;
      batch_add(batch.value, token, pos++, true);
      if (llama_decode(context.get(), batch.value) != 0) {
        throw std::runtime_error("token decode failed");
      }
    }
    return out;
  }

 private:
  struct ContextDeleter {
    void operator()(llama_context* context) const noexcept { llama_free(context); }
  };
  struct SamplerDeleter {
    void operator()(llama_sampler* sampler) const noexcept { llama_sampler_free(sampler); }
  };
  using ContextPtr = std::unique_ptr<llama_context, ContextDeleter>;
  using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

  struct BatchGuard {
    explicit BatchGuard(llama_batch batch) : value(batch) {}
    ~BatchGuard() { llama_batch_free(value); }
    BatchGuard(const BatchGuard&) = delete;
    BatchGuard& operator=(const BatchGuard&) = delete;
    llama_batch value;
  };

  static llama_sampler* make_sampler(const GenerationParams& params) {
    llama_sampler* chain = llama_sampler_chain_init(llama_sampler_chain_default_params());
    if (chain == nullptr) {
      return nullptr;
    }
    llama_sampler_chain_add(chain, llama_sampler_init_penalties(kPenaltyWindow, params.repeat_penalty, 0.0F, 0.0F));
    llama_sampler_chain_add(chain, llama_sampler_init_top_k(params.top_k));
    llama_sampler_chain_add(chain, llama_sampler_init_top_p(params.top_p, 1));
    llama_sampler_chain_add(chain, llama_sampler_init_temp(params.temperature));
    llama_sampler_chain_add(chain, llama_sampler_init_dist(kSamplerSeed));
    return chain;
  }

  LoadProfile profile_;
  llama_model* model_{nullptr};
  const llama_vocab* vocab_{nullptr};
  llama_context_params context_params_{};
};

}  // namespace

BackendFactory make_llama_backend_factory() {
  return [](const std::string& model_path, const LoadProfile& profile) -> std::unique_ptr<InferenceBackend> {
    return std::make_unique<LlamaBackend>(model_path, profile);
  };
}

}  // namespace replyd::llm
