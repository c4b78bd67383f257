#pragma once

#include <cstddef>
#include <string_view>

namespace core {

// Observational channel for the matcher. Implementations must not throw
// and cannot influence outcomes.
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void pass_started(std::string_view pass_name, std::size_t record_count) noexcept = 0;
    virtual void progress(std::string_view pass_name, std::size_t visited, std::size_t record_count) noexcept = 0;
    virtual void note(std::string_view message) noexcept = 0;
};

class NullProgressSink : public IProgressSink {
public:
    void pass_started(std::string_view, std::size_t) noexcept override {}
    void progress(std::string_view, std::size_t, std::size_t) noexcept override {}
    void note(std::string_view) noexcept override {}
};

} // namespace core
