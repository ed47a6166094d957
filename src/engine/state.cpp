#include <textexpander/engine.h>
#include <algorithm>

namespace textexpander {

MatchState::MatchState(size_t capacity)
    : ring_(std::max<size_t>(capacity, 1), 0)
    , head_(0)
    , size_(0) {
}

void MatchState::push(char32_t ch) {
    if (size_ < ring_.size()) {
        ring_[(head_ + size_) % ring_.size()] = ch;
        size_++;
        return;
    }

    // Full: overwrite the oldest character
    ring_[head_] = ch;
    head_ = (head_ + 1) % ring_.size();
}

void MatchState::popBack() {
    if (size_ > 0) {
        size_--;
    }
}

void MatchState::clear() {
    head_ = 0;
    size_ = 0;
}

char32_t MatchState::fromEnd(size_t offset) const {
    if (offset >= size_) {
        return 0;
    }
    return ring_[(head_ + size_ - 1 - offset) % ring_.size()];
}

std::u32string MatchState::contents() const {
    std::u32string text;
    text.reserve(size_);
    for (size_t i = 0; i < size_; ++i) {
        text.push_back(ring_[(head_ + i) % ring_.size()]);
    }
    return text;
}

} // namespace textexpander
