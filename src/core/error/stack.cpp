#include "stack.h"

#include <algorithm>
#include <cstddef>
#include <sstream>

#if STACKERR_ENABLE_STACK_CAPTURE
  #include <execinfo.h>
  #define STACKERR_RETURN_ADDRESS() __builtin_return_address(0)
#else
  #define STACKERR_RETURN_ADDRESS() nullptr
#endif

namespace stackerr::core::error {

namespace {

#if STACKERR_ENABLE_STACK_CAPTURE
// Slots for frames between backtrace() and the anchor: capture_from, the
// public capture function and any interceptor wrapped around backtrace()
constexpr std::size_t CAPTURE_HEADROOM = 8;
#endif

// Frames starting at the one that returns to `anchor`, after dropping
// `skip` of them. The anchor is the return address of the public capture
// function, so whatever sits above it on the live stack never counts.
std::vector<Frame> capture_from(const void* anchor, std::size_t skip, std::size_t max_frames) {
    std::vector<Frame> frames;

#if STACKERR_ENABLE_STACK_CAPTURE
    std::vector<void*> buffer(max_frames + skip + CAPTURE_HEADROOM);
    int nframes = ::backtrace(buffer.data(), static_cast<int>(buffer.size()));
    if (nframes <= 0) {
        return frames;
    }

    auto end = buffer.begin() + nframes;
    auto first = std::find(buffer.begin(), end, anchor);
    if (first == end || static_cast<std::size_t>(end - first) <= skip) {
        return frames;
    }
    first += static_cast<std::ptrdiff_t>(skip);

    auto count = std::min(max_frames, static_cast<std::size_t>(end - first));
    frames.reserve(count);
    for (auto it = first; it != first + static_cast<std::ptrdiff_t>(count); ++it) {
        frames.emplace_back(static_cast<const void*>(*it));
    }
#else
    STACKERR_UNUSED(anchor);
    STACKERR_UNUSED(skip);
    STACKERR_UNUSED(max_frames);
#endif

    return frames;
}

} // namespace

Stack Stack::capture(std::size_t skip, std::size_t max_frames) {
    return Stack(capture_from(STACKERR_RETURN_ADDRESS(), skip, max_frames));
}

std::string Stack::format(bool verbose, const TraceConfig& config) const {
    if (!verbose) {
        return {};
    }

    std::ostringstream oss;
    for (const auto& frame : frames_) {
        oss << frame.format(true, config);
    }
    return oss.str();
}

Stack capture_frame(std::size_t skip) {
    return Stack(capture_from(STACKERR_RETURN_ADDRESS(), skip, 1));
}

Stack append_stack_trace(const Stack& newer, const Stack& older) {
    std::vector<Frame> appended;
    appended.reserve(newer.size() + older.size());
    appended.insert(appended.end(), newer.begin(), newer.end());
    appended.insert(appended.end(), older.begin(), older.end());
    return Stack(std::move(appended));
}

} // namespace stackerr::core::error
