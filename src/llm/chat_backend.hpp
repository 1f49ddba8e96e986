#ifndef PIIANON_LLM_CHAT_BACKEND_HPP
#define PIIANON_LLM_CHAT_BACKEND_HPP

#include <stdexcept>
#include <string>

namespace piianon {
namespace llm {

class LlmError : public std::runtime_error
{
public:
    explicit LlmError(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * @class ChatBackend
 * @brief One system + user exchange with a chat model. Implementations must be
 *        callable from several threads at once.
 */
class ChatBackend
{
public:
    virtual ~ChatBackend() = default;

    /**
     * @return The assistant message content.
     * @throw LlmError once the backend has given up on the request.
     */
    virtual std::string complete(const std::string &systemPrompt, const std::string &userText) = 0;
};

} // namespace llm
} // namespace piianon

#endif // PIIANON_LLM_CHAT_BACKEND_HPP
