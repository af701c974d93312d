#pragma once

#include "llm/backend.hpp"

namespace replyd::llm {

// Factory producing llama.cpp backends. Loading throws ModelLoadError;
// inference throws ContextWindowError when the prompt leaves no room for
// max_tokens of output.
BackendFactory make_llama_backend_factory();

}  // namespace replyd::llm
