#pragma once
#include <vector>
#include <cstddef>
#include <algorithm>

// Fixed-capacity history of the most recent samples.
// push() overwrites the oldest entry once full; lag 0 is the newest sample.
// Not thread-safe; the owner serializes access.
template <typename T>
class HistoryRing {
public:
    explicit HistoryRing(size_t capacity = 1024)
        : buf_(std::max<size_t>(capacity, 1)) {}

    void push(T value) {
        buf_[writeIdx_] = value;
        writeIdx_ = (writeIdx_ + 1) % buf_.size();
        if (size_ < buf_.size()) size_++;
    }

    // Sample pushed `lag` pushes ago. Slots never written read as T{}.
    T at(size_t lag) const {
        size_t n = buf_.size();
        return buf_[(writeIdx_ + n - 1 - (lag % n)) % n];
    }

    // Visit every slot newest-first: fn(lag, value) for lag in [0, capacity).
    // Split into two contiguous runs so the hot loop has no modulo.
    template <typename Fn>
    void forEachNewest(Fn&& fn) const {
        size_t lag = 0;
        for (size_t i = writeIdx_; i-- > 0; )
            fn(lag++, buf_[i]);
        for (size_t i = buf_.size(); i-- > writeIdx_; )
            fn(lag++, buf_[i]);
    }

    size_t capacity()   const { return buf_.size(); }
    size_t size()       const { return size_; }
    size_t writeIndex() const { return writeIdx_; }

    void reset() {
        std::fill(buf_.begin(), buf_.end(), T{});
        writeIdx_ = 0;
        size_ = 0;
    }

private:
    std::vector<T> buf_;
    size_t writeIdx_ = 0;
    size_t size_ = 0;
};
