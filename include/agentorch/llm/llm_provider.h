#ifndef AGENTORCH_LLM_LLM_PROVIDER_H
#define AGENTORCH_LLM_LLM_PROVIDER_H

#include <string>

namespace agentorch {

// Prompt -> completion text. Implementations throw CollaboratorError on
// provider, auth or network failures and must tolerate concurrent callers.
class LlmProvider {
public:
    virtual ~LlmProvider() = default;

    virtual std::string complete(const std::string& prompt) = 0;
    virtual bool is_available() const { return true; }
};

} // namespace agentorch

#endif // AGENTORCH_LLM_LLM_PROVIDER_H
