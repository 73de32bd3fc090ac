#pragma once

#ifndef CORE_ERROR_STACK_H
#define CORE_ERROR_STACK_H

#include <cstddef>
#include <initializer_list>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

#include <config/config.h>

#include "frame.h"
#include "trace_config.h"

namespace stackerr::core::error {

/**
 * @brief Ordered sequence of frames, newest first
 *
 * A stack is an immutable value. Combining stacks always produces a new
 * one (see append_stack_trace). No duplicate elimination and no depth limit
 * is applied to merged stacks.
 */
class Stack {
public:
    using container_type = std::vector<Frame>;
    using const_iterator = container_type::const_iterator;

    /**
     * @brief Empty stack
     */
    Stack() = default;

    explicit Stack(std::vector<Frame> frames)
        : frames_(std::move(frames)) {
    }

    Stack(std::initializer_list<Frame> frames)
        : frames_(frames) {
    }

    /**
     * @brief Capture the live call stack
     *
     * The first frame is the caller of capture(), after dropping `skip`
     * further frames. Frames are located relative to the return address of
     * capture(), so wrappers around backtrace() (sanitizer interceptors)
     * do not shift the result. Returns an empty stack when the platform has
     * no backtrace support.
     */
    STACKERR_NOINLINE static Stack capture(std::size_t skip = 0,
                         std::size_t max_frames = config::DEFAULT_MAX_CAPTURED_FRAMES);

    const std::vector<Frame>& frames() const noexcept { return frames_; }

    bool empty() const noexcept { return frames_.empty(); }

    std::size_t size() const noexcept { return frames_.size(); }

    const Frame& operator[](std::size_t index) const {
        return frames_.at(index);
    }

    const_iterator begin() const noexcept { return frames_.begin(); }
    const_iterator end() const noexcept { return frames_.end(); }

    /**
     * @brief Compact or verbose rendering
     *
     * The compact form is always empty. The verbose form renders every frame
     * as "\n\tat function(file:line)" in stack order.
     */
    std::string format(bool verbose,
                       const TraceConfig& config = TraceConfig::process()) const;

    bool operator==(const Stack& other) const noexcept {
        return frames_ == other.frames_;
    }

    bool operator!=(const Stack& other) const noexcept {
        return !(*this == other);
    }

private:
    std::vector<Frame> frames_;
};

/**
 * @brief One-frame stack for a call site
 *
 * Public entry points default `loc` so that the recorded frame is always
 * their caller.
 */
inline Stack caller(const std::source_location& loc = std::source_location::current()) {
    return Stack{Frame(loc)};
}

/**
 * @brief One-frame stack for a code address on the live call stack
 *
 * skip == 0 records the caller of capture_frame(), each increment moves one
 * frame further out. Empty when the stack is not that deep or cannot be
 * walked on this platform.
 */
STACKERR_NOINLINE Stack capture_frame(std::size_t skip = 0);

/**
 * @brief Concatenate two stacks
 *
 * The result holds all of `newer` followed by all of `older`, both in
 * their original order.
 */
Stack append_stack_trace(const Stack& newer, const Stack& older);

} // namespace stackerr::core::error

#endif // CORE_ERROR_STACK_H
