#pragma once

#include "backend.hpp"

#include <string>

// Sends the transcript through an OpenAI-compatible chat completion endpoint
// with a fixed system prompt and returns the assistant's reply.
class ChatPostProcessor : public PostProcessor {
public:
    ChatPostProcessor(std::string url, std::string model, std::string prompt);
    ~ChatPostProcessor() override;

    std::expected<std::string, std::string> process(const std::string& transcript) override;

    std::string request_body(const std::string& transcript) const;
    static std::expected<std::string, std::string> parse_response(const std::string& body);

private:
    std::string url_;
    std::string model_;
    std::string prompt_;
};
