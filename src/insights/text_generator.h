#pragma once

#include <chrono>
#include <string>

#include "errors.h"

namespace datalens {

// External text-completion capability. Implementations throw
// GenerationTimeoutError or GenerationFailure; they should give up on their
// own once `timeout` has passed.
class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;

    virtual auto Generate(const std::string& prompt, std::chrono::milliseconds timeout) -> std::string = 0;
};

// Stands in when no provider is configured; every report uses templates.
class UnavailableTextGenerator final : public ITextGenerator {
public:
    auto Generate(const std::string& /*prompt*/, std::chrono::milliseconds /*timeout*/) -> std::string override {
        throw GenerationFailure("No text generation provider configured");
    }
};

} // namespace datalens
