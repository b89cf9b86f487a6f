#include "owned_buffer.hpp"
#include <localip/error.hpp>
#include <glog/logging.h>
#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace localip {

BufferAllocator BufferAllocator::standard() {
    BufferAllocator allocator;
    allocator.allocate = [](size_t size) { return std::make_unique<uint8_t[]>(size).release(); };
    allocator.deallocate = [](uint8_t* data, size_t) { std::default_delete<uint8_t[]>()(data); };
    return allocator;
}

OwnedBuffer::OwnedBuffer(size_t size, BufferAllocator allocator)
    : allocator_(std::move(allocator)) {
    if (size == 0) {
        return;
    }
    data_ = allocator_.allocate(size);
    size_ = size;
    std::memset(data_, 0, size_);
}

OwnedBuffer::~OwnedBuffer() {
    reset();
}

OwnedBuffer::OwnedBuffer(OwnedBuffer&& other) noexcept
    : data_(other.data_), size_(other.size_), allocator_(std::move(other.allocator_)) {
    other.data_ = nullptr;
    other.size_ = 0;
}

OwnedBuffer& OwnedBuffer::operator=(OwnedBuffer&& other) noexcept {
    if (this != &other) {
        reset();
        data_ = other.data_;
        size_ = other.size_;
        allocator_ = std::move(other.allocator_);
        other.data_ = nullptr;
        other.size_ = 0;
    }
    return *this;
}

void OwnedBuffer::reset() {
    if (data_ != nullptr) {
        allocator_.deallocate(data_, size_);
        data_ = nullptr;
        size_ = 0;
    }
}

OwnedBuffer fill_with_growth(size_t initial_size,
                             int max_attempts,
                             const FillFunction& fill,
                             const BufferAllocator& allocator) {
    if (max_attempts < 1) {
        throw Error::strategy_failure("Buffer fill needs at least one attempt");
    }

    size_t required = initial_size;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        OwnedBuffer buffer(required, allocator);
        if (fill(buffer, required) == FillStatus::DONE) {
            return buffer;
        }
        VLOG(1) << "Buffer of " << buffer.size() << " bytes too small, kernel asks for "
                << required << " (attempt " << attempt << "/" << max_attempts << ")";
    }

    LOG(ERROR) << "Kernel output buffer still too small after " << max_attempts << " attempts";
    throw Error::strategy_failure("Buffer still too small after " + std::to_string(max_attempts) +
                                  " attempts (" + std::to_string(required) + " bytes required)");
}

} // namespace localip
