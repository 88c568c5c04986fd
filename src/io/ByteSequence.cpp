#include "ByteSequence.h"

namespace jstream::io {

void ByteSequence::append(std::string_view segment) {
    if (segment.empty()) {
        return;
    }
    segments_.push_back(segment);
    size_ += segment.size();
}

std::string_view ByteSequence::linearize(std::string &scratch) const {
    if (segments_.empty()) {
        return {};
    }
    if (segments_.size() == 1) {
        return segments_.front();
    }
    scratch.clear();
    scratch.reserve(size_);
    for (std::string_view segment : segments_) {
        scratch.append(segment);
    }
    return scratch;
}

std::string ByteSequence::to_string() const {
    std::string out;
    out.reserve(size_);
    for (std::string_view segment : segments_) {
        out.append(segment);
    }
    return out;
}

} // namespace jstream::io
