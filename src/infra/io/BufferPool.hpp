#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stack>
#include <vector>

namespace courier::infra {

/**
 * @brief Recycles the chunk buffers used by concurrent transfers.
 * Buffers go back to the pool through the shared_ptr deleter.
 */
class BufferPool {
   public:
    using BufferPtr = std::shared_ptr<std::vector<std::uint8_t>>;

    static constexpr std::size_t DEFAULT_BUFFER_SIZE = 512 * 1024;

    static BufferPool& Instance() {
        static BufferPool instance(4, DEFAULT_BUFFER_SIZE);
        return instance;
    }

    BufferPtr Acquire(std::size_t size = DEFAULT_BUFFER_SIZE) {
        std::unique_ptr<std::vector<std::uint8_t>> raw;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!pool_.empty()) {
                raw = std::move(pool_.top());
                pool_.pop();
            }
        }

        if (!raw) {
            raw = std::make_unique<std::vector<std::uint8_t>>();
        }
        raw->resize(size);

        return BufferPtr(raw.release(), [this](std::vector<std::uint8_t>* p) { Release(p); });
    }

   private:
    BufferPool(std::size_t initial_count, std::size_t buffer_size) {
        for (std::size_t i = 0; i < initial_count; ++i) {
            pool_.push(std::make_unique<std::vector<std::uint8_t>>(buffer_size));
        }
    }

    void Release(std::vector<std::uint8_t>* p) {
        if (!p) return;
        std::lock_guard<std::mutex> lock(mutex_);
        pool_.push(std::unique_ptr<std::vector<std::uint8_t>>(p));
    }

    std::stack<std::unique_ptr<std::vector<std::uint8_t>>> pool_;
    std::mutex mutex_;
};

}  // namespace courier::infra
