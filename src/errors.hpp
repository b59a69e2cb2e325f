#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace strucache {

// Raised when a durable backend cannot be created or opened, or when a
// key cannot be derived from its inputs. Never raised by get/set once a
// backend has been constructed.
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message, std::string operation = "")
        : std::runtime_error(message), operation_(std::move(operation)) {}

    const std::string& operation() const { return operation_; }

private:
    std::string operation_;
};

} // namespace strucache
