#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace replyd::llm {

enum class ModelError : std::uint8_t {
  None = 0,
  ModelUnavailable,
  ModelLoadFailed,
  ContextWindowExceeded,
  InferenceFailed,
};

const char* to_string(ModelError error) noexcept;

// Fixed, minimal resource profile used for every load.
struct LoadProfile {
  std::int32_t context_size{256};
  std::int32_t threads{1};
  std::int32_t batch{32};
  bool use_mmap{true};
  bool use_mlock{false};
  std::int32_t gpu_layers{0};
};

struct GenerationParams {
  std::int32_t max_tokens{50};
  float temperature{0.5F};
  float top_p{0.8F};
  std::int32_t top_k{15};
  float repeat_penalty{1.05F};
  std::vector<std::string> stop{"\n\nEmail:", "\n\nReply:", "\n---", "###", "\n\n\n"};

  // Shorter prompt tried once when the first reply comes back too short.
  // Empty disables the retry.
  std::string retry_prompt{};
  std::int32_t retry_max_tokens{60};
  float retry_temperature{0.9F};
};

// Thrown by backends when the prompt does not fit the context window.
class ContextWindowError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown by backend factories when the weights cannot be instantiated.
class ModelLoadError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The loaded inference resource. Not reentrant: callers serialize access.
class InferenceBackend {
 public:
  virtual std::string infer(const std::string& prompt, const GenerationParams& params) = 0;
  virtual ~InferenceBackend() = default;
};

using BackendFactory = std::function<std::unique_ptr<InferenceBackend>(const std::string& model_path, const LoadProfile& profile)>;

}  // namespace replyd::llm
