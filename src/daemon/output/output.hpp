#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>

// Where a finished transcript goes.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};

// Builds the method named in config or a request. nullptr means "none".
using OutputFactory = std::function<std::unique_ptr<OutputMethod>(const std::string& method)>;
