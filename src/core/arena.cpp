#include "lexis/arena.hpp"
#include "lexis/error.hpp"

#include <cstdint>

namespace lexis {

Arena::Arena(size_t block_size)
    : block_size_(block_size ? block_size : DEFAULT_BLOCK_SIZE) {}

Arena::Block& Arena::new_block(size_t min_size) {
    Block block;
    block.size = min_size > block_size_ ? min_size : block_size_;
    // value-initialized: every allocation starts zeroed
    block.data = std::make_unique<std::byte[]>(block.size);
    blocks_.push_back(std::move(block));
    return blocks_.back();
}

void* Arena::allocate(size_t size, size_t alignment) {
    LEXIS_CHECK_ARGUMENT(alignment != 0 && (alignment & (alignment - 1)) == 0,
                         "alignment must be a power of two");
    if (size == 0) size = 1;

    if (!blocks_.empty()) {
        Block& block = blocks_.back();
        auto base = reinterpret_cast<uintptr_t>(block.data.get());
        uintptr_t aligned = (base + block.used + alignment - 1) & ~(uintptr_t(alignment) - 1);
        size_t offset = static_cast<size_t>(aligned - base);
        if (offset + size <= block.size) {
            block.used = offset + size;
            bytes_allocated_ += size;
            return block.data.get() + offset;
        }
    }

    // Oversized requests get a block of their own
    Block& block = new_block(size + alignment);
    auto base = reinterpret_cast<uintptr_t>(block.data.get());
    uintptr_t aligned = (base + alignment - 1) & ~(uintptr_t(alignment) - 1);
    size_t offset = static_cast<size_t>(aligned - base);
    block.used = offset + size;
    bytes_allocated_ += size;
    return block.data.get() + offset;
}

bool Arena::owns(const void* ptr) const noexcept {
    const auto* p = static_cast<const std::byte*>(ptr);
    for (const Block& block : blocks_) {
        if (p >= block.data.get() && p < block.data.get() + block.size) {
            return true;
        }
    }
    return false;
}

} // namespace lexis
