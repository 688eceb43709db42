#pragma once

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

namespace portopt {
namespace core {

// Receives failures for later inspection. Implementations must not throw.
class IErrorSink {
public:
    virtual ~IErrorSink() = default;

    virtual void recordError(const std::exception& error,
                             const std::string& operation,
                             const nlohmann::json& context = nlohmann::json::object()) noexcept = 0;
    virtual void recordOperation(const std::string& operation) noexcept = 0;
};

} // namespace core
} // namespace portopt
