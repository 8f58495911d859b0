#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tusgate {

// Client request body. read() may return fewer bytes than asked;
// 0 means end of stream.
class ByteSource {
public:
    virtual ~ByteSource() = default;
    virtual size_t read(uint8_t* buf, size_t max_len) = 0;
};

// Client response body. write() returns only once the bytes have been handed
// to the peer, so a slow reader throttles the producer.
class ByteSink {
public:
    virtual ~ByteSink() = default;
    virtual void write(std::span<const uint8_t> data) = 0;
};

// Reads until n bytes arrive or the source ends; a short result is not an error
std::vector<uint8_t> read_up_to(ByteSource& source, size_t n);

// Appends up to n bytes to buf; returns how many were read
size_t read_append(ByteSource& source, std::vector<uint8_t>& buf, size_t n);

// Discards up to n bytes; returns how many were discarded
uint64_t skip(ByteSource& source, uint64_t n);

class MemoryByteSource : public ByteSource {
public:
    explicit MemoryByteSource(std::vector<uint8_t> data, size_t max_read = 0)
        : data_(std::move(data)), max_read_(max_read) {}
    explicit MemoryByteSource(const std::string& data, size_t max_read = 0)
        : data_(data.begin(), data.end()), max_read_(max_read) {}

    size_t read(uint8_t* buf, size_t max_len) override;
    size_t remaining() const { return data_.size() - pos_; }

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
    size_t max_read_;   // caps each read, 0 = unlimited
};

class MemoryByteSink : public ByteSink {
public:
    void write(std::span<const uint8_t> data) override {
        data_.insert(data_.end(), data.begin(), data.end());
        ++writes_;
    }

    const std::vector<uint8_t>& data() const { return data_; }
    std::string str() const { return std::string(data_.begin(), data_.end()); }
    size_t writes() const { return writes_; }

private:
    std::vector<uint8_t> data_;
    size_t writes_ = 0;
};

} // namespace tusgate
