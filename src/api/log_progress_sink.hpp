#pragma once

#include <cstddef>
#include <string_view>

#include "core/progress_sink.hpp"
#include "util/log.hpp"

namespace api {

// Forwards matcher progress to the process log.
class LogProgressSink : public core::IProgressSink {
public:
    void pass_started(std::string_view pass_name, std::size_t record_count) noexcept override {
        LOG_INFO("Matching by %.*s (%zu records)", static_cast<int>(pass_name.size()), pass_name.data(),
                 record_count);
    }

    void progress(std::string_view pass_name, std::size_t visited, std::size_t record_count) noexcept override {
        LOG_DEBUG("%.*s: %zu/%zu", static_cast<int>(pass_name.size()), pass_name.data(), visited, record_count);
    }

    void note(std::string_view message) noexcept override {
        LOG_INFO("%.*s", static_cast<int>(message.size()), message.data());
    }
};

} // namespace api
