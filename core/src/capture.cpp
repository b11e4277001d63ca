#include "cordon/capture.h"

#include <algorithm>

namespace cordon {

const char* const kTruncationMarker = "\n...[output truncated]";

bool BoundedCapture::append(const char* data, size_t n) {
    if (truncated_) return false;
    size_t room = cap_ > buf_.size() ? cap_ - buf_.size() : 0;
    size_t take = std::min(room, n);
    buf_.append(data, take);
    if (take == n) return true;
    truncated_ = true;
    buf_ += kTruncationMarker;
    return false;
}

} // namespace cordon
