#include <rowbridge/frame/transform.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace rowbridge::frame {

auto Frame::execute(const FrameTransform& transform) -> Result<void> {
    auto next = transform.work(state_);
    if (!next) {
        spdlog::debug("{} failed: {}", transform.name(), next.error().format());
        return std::unexpected(std::move(next.error()));
    }
    state_ = std::move(*next);
    return {};
}

}  // namespace rowbridge::frame
