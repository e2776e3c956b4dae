#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace stream_keeper {

/// Splits a byte stream into newline-terminated lines.  A trailing '\r' is
/// dropped, so "\r\n" keepalives come out as empty lines.  Bytes after the
/// last '\n' are held until the next feed(), up to maxPending bytes.
class LineFramer {
public:
    static constexpr std::size_t kDefaultMaxPending = 1024 * 1024;

    explicit LineFramer(std::size_t maxPending = kDefaultMaxPending)
        : mMaxPending(maxPending) {}

    std::vector<std::string> feed(const char* data, std::size_t size);

    /// True once an unterminated line has outgrown maxPending.  The tail is
    /// discarded and the stream can no longer be framed.
    bool overflowed() const { return mOverflowed; }

    std::size_t pendingBytes() const { return mPending.size(); }
    void reset() {
        mPending.clear();
        mOverflowed = false;
    }

private:
    std::string mPending;
    std::size_t mMaxPending;
    bool        mOverflowed = false;
};

} // namespace stream_keeper
