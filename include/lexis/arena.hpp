#pragma once

#include <cstddef>
#include <cstring>
#include <memory>
#include <type_traits>
#include <vector>

namespace lexis {

/**
 * Arena - block-based bump allocator
 *
 * Every allocation is zero-filled and lives until the arena is destroyed;
 * there is no per-allocation free. The vocabulary owns one arena for its
 * permanent lexemes and vectors; callers own scratch arenas for lookups
 * that must not enter the shared table.
 */
class Arena {
public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 64 * 1024;

    explicit Arena(size_t block_size = DEFAULT_BLOCK_SIZE);
    ~Arena() = default;

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    /**
     * Allocate @p size zeroed bytes aligned to @p alignment.
     * Zero-byte requests still return a unique non-null pointer.
     */
    void* allocate(size_t size, size_t alignment = alignof(std::max_align_t));

    /// Allocate @p count value-initialized objects of a trivial type.
    template<typename T>
    T* alloc(size_t count = 1) {
        static_assert(std::is_trivially_destructible_v<T>,
                      "Arena never runs destructors");
        void* mem = allocate(sizeof(T) * count, alignof(T));
        T* out = static_cast<T*>(mem);
        for (size_t i = 0; i < count; ++i) {
            new (out + i) T();
        }
        return out;
    }

    /**
     * Copy the first min(old_count, new_count) elements of @p old into a
     * fresh allocation of @p new_count elements; the tail stays zero.
     * The old storage remains valid until the arena dies.
     */
    template<typename T>
    T* realloc(const T* old, size_t old_count, size_t new_count) {
        T* fresh = alloc<T>(new_count);
        size_t keep = old_count < new_count ? old_count : new_count;
        if (old && keep) {
            std::memcpy(fresh, old, keep * sizeof(T));
        }
        return fresh;
    }

    /// True if @p ptr points into memory handed out by this arena.
    bool owns(const void* ptr) const noexcept;

    size_t bytes_allocated() const noexcept { return bytes_allocated_; }
    size_t block_count() const noexcept { return blocks_.size(); }

private:
    struct Block {
        std::unique_ptr<std::byte[]> data;
        size_t size = 0;
        size_t used = 0;
    };

    Block& new_block(size_t min_size);

    size_t block_size_;
    size_t bytes_allocated_ = 0;
    std::vector<Block> blocks_;
};

} // namespace lexis
