#pragma once

#include <plugview/result.hpp>
#include <string>

namespace plugview {

enum class PresentMode {
    Fifo,
    Mailbox,
    Immediate
};

struct SurfaceOptions {
    PresentMode presentMode = PresentMode::Fifo;
};

Result<PresentMode> parsePresentMode(const std::string& name) noexcept;
const char* toString(PresentMode mode) noexcept;

} // namespace plugview
