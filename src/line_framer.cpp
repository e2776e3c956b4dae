#include "line_framer.hpp"

namespace stream_keeper {

std::vector<std::string> LineFramer::feed(const char* data, std::size_t size) {
    std::vector<std::string> lines;
    if (mOverflowed) return lines;
    mPending.append(data, size);

    std::size_t start = 0;
    for (;;) {
        const auto nl = mPending.find('\n', start);
        if (nl == std::string::npos) break;

        std::size_t end = nl;
        if (end > start && mPending[end - 1] == '\r') {
            --end;
        }
        lines.emplace_back(mPending, start, end - start);
        start = nl + 1;
    }
    mPending.erase(0, start);

    if (mPending.size() > mMaxPending) {
        mPending.clear();
        mOverflowed = true;
    }
    return lines;
}

} // namespace stream_keeper
