#include "tusgate/upload/byte_stream.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace tusgate {

size_t read_append(ByteSource& source, std::vector<uint8_t>& buf, size_t n) {
    size_t start = buf.size();
    buf.resize(start + n);
    size_t got = 0;
    while (got < n) {
        size_t r = source.read(buf.data() + start + got, n - got);
        if (r == 0) break;
        got += r;
    }
    buf.resize(start + got);
    return got;
}

std::vector<uint8_t> read_up_to(ByteSource& source, size_t n) {
    std::vector<uint8_t> buf;
    read_append(source, buf, n);
    return buf;
}

uint64_t skip(ByteSource& source, uint64_t n) {
    std::array<uint8_t, 64 * 1024> scratch;
    uint64_t skipped = 0;
    while (skipped < n) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(scratch.size(), n - skipped));
        size_t r = source.read(scratch.data(), want);
        if (r == 0) break;
        skipped += r;
    }
    return skipped;
}

size_t MemoryByteSource::read(uint8_t* buf, size_t max_len) {
    size_t n = std::min(max_len, data_.size() - pos_);
    if (max_read_ > 0) n = std::min(n, max_read_);
    if (n > 0) {
        std::memcpy(buf, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

} // namespace tusgate
