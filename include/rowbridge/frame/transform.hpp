#pragma once

#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>

#include <string>
#include <utility>

namespace rowbridge::frame {

/// A named, schema-aware operation over a whole dataset.
///
/// work() is a pure function of the input state and the transform's own
/// parameters; it never mutates its input.
class FrameTransform {
   public:
    FrameTransform() = default;
    FrameTransform(const FrameTransform&) = default;
    FrameTransform(FrameTransform&&) = default;
    auto operator=(const FrameTransform&) -> FrameTransform& = default;
    auto operator=(FrameTransform&&) -> FrameTransform& = default;
    virtual ~FrameTransform() = default;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
    [[nodiscard]] virtual auto work(const Dataset& state) const -> Result<Dataset> = 0;
};

/// Holds the current dataset of a frame and applies transforms to it.
class Frame {
   public:
    Frame() = default;
    explicit Frame(Dataset state) : state_(std::move(state)) {}

    [[nodiscard]] auto state() const noexcept -> const Dataset& { return state_; }
    [[nodiscard]] auto schema() const noexcept -> const Schema& { return state_.schema(); }

    /// Replace the state with the transform's result. On failure the state
    /// is left as it was.
    auto execute(const FrameTransform& transform) -> Result<void>;

   private:
    Dataset state_;
};

}  // namespace rowbridge::frame
