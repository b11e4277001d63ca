#pragma once
#include <cstddef>
#include <string>

namespace cordon {

// Appended once to a stream that hit its cap.
extern const char* const kTruncationMarker;

// Byte-capped buffer for one captured stream of one execution.
class BoundedCapture {
public:
    explicit BoundedCapture(size_t cap) : cap_(cap) {}

    // Append up to the remaining capacity. Returns false once the cap has been
    // exceeded; the marker is appended the first time that happens.
    bool append(const char* data, size_t n);

    bool truncated() const { return truncated_; }
    size_t size() const { return buf_.size(); }
    const std::string& data() const { return buf_; }
    std::string take() { return std::move(buf_); }

private:
    size_t cap_;
    bool truncated_{false};
    std::string buf_;
};

} // namespace cordon
