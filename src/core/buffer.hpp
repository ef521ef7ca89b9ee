// httpgate I/O Buffer
// Growable byte buffer with a read cursor, used for socket reads

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

namespace httpgate::core {

/// Contiguous byte buffer split into [consumed | readable | writable].
///
/// Reads land in the writable tail (prepare/commit); parsers look at the
/// readable window and consume() what they used. Leftover bytes stay put,
/// which is how pipelined requests survive between exchanges.
class IoBuffer {
public:
    explicit IoBuffer(size_t initial_capacity = 16384) { data_.resize(initial_capacity); }

    [[nodiscard]] std::span<const uint8_t> readable() const noexcept {
        return {data_.data() + begin_, end_ - begin_};
    }

    [[nodiscard]] size_t size() const noexcept { return end_ - begin_; }
    [[nodiscard]] bool empty() const noexcept { return begin_ == end_; }

    void consume(size_t n) noexcept {
        begin_ += (n > size()) ? size() : n;
        if (begin_ == end_) {
            begin_ = end_ = 0;
        }
    }

    /// Writable tail of at least min_bytes (compacts, then grows if needed)
    [[nodiscard]] std::span<uint8_t> prepare(size_t min_bytes) {
        if (data_.size() - end_ < min_bytes && begin_ > 0) {
            size_t live = size();
            std::memmove(data_.data(), data_.data() + begin_, live);
            begin_ = 0;
            end_ = live;
        }
        if (data_.size() - end_ < min_bytes) {
            data_.resize(end_ + min_bytes);
        }
        return {data_.data() + end_, data_.size() - end_};
    }

    void commit(size_t n) noexcept { end_ += n; }

    void clear() noexcept { begin_ = end_ = 0; }

private:
    std::vector<uint8_t> data_;
    size_t begin_ = 0;
    size_t end_ = 0;
};

} // namespace httpgate::core
