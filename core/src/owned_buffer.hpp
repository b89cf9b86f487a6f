#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace localip {

// Allocation hooks for kernel output buffers. The default uses new[]/delete[];
// tests plug in counting hooks.
struct BufferAllocator {
    std::function<uint8_t*(size_t)> allocate;
    std::function<void(uint8_t*, size_t)> deallocate;

    static BufferAllocator standard();
};

// Zero-filled heap buffer released exactly once by its destructor. Move-only.
class OwnedBuffer {
public:
    explicit OwnedBuffer(size_t size, BufferAllocator allocator = BufferAllocator::standard());
    ~OwnedBuffer();

    OwnedBuffer(OwnedBuffer&& other) noexcept;
    OwnedBuffer& operator=(OwnedBuffer&& other) noexcept;

    OwnedBuffer(const OwnedBuffer&) = delete;
    OwnedBuffer& operator=(const OwnedBuffer&) = delete;

    uint8_t* data() { return data_; }
    const uint8_t* data() const { return data_; }
    size_t size() const { return size_; }

    template <typename T>
    T* as() { return reinterpret_cast<T*>(data_); }

private:
    void reset();

    uint8_t* data_ = nullptr;
    size_t size_ = 0;
    BufferAllocator allocator_;
};

enum class FillStatus {
    DONE,
    TOO_SMALL  // required_size has been updated by the callee
};

// Fills a kernel output buffer, growing it to the size the kernel asks for.
// At most `max_attempts` calls are made; if the buffer is still too small
// after that an ErrorKind::STRATEGY_FAILURE is thrown. The previous buffer is
// released as soon as a bigger one replaces it.
using FillFunction = std::function<FillStatus(OwnedBuffer& buffer, size_t& required_size)>;

OwnedBuffer fill_with_growth(size_t initial_size,
                             int max_attempts,
                             const FillFunction& fill,
                             const BufferAllocator& allocator = BufferAllocator::standard());

} // namespace localip
