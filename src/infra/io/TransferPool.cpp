#include "TransferPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace courier::infra {

namespace {

// Linux caps thread names at 15 characters.
void name_current_thread(const std::string& name) {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), name.substr(0, 15).c_str());
#else
    (void)name;
#endif
}

}  // namespace

TransferPool::TransferPool(std::size_t threads, std::string name) : name_(std::move(name)) {
    if (threads == 0) {
        throw std::invalid_argument("TransferPool needs at least one thread");
    }

    contexts_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        // Each context is driven by exactly one thread.
        auto ioc = std::make_shared<asio::io_context>(1);
        guards_.emplace_back(asio::make_work_guard(*ioc));
        contexts_.push_back(std::move(ioc));
    }
}

TransferPool::~TransferPool() {
    Stop();
    threads_.clear();
}

void TransferPool::Start() {
    if (!threads_.empty()) {
        return;
    }

    spdlog::info("Starting {} {} thread(s).", contexts_.size(), name_);

    for (std::size_t i = 0; i < contexts_.size(); ++i) {
        threads_.emplace_back([ioc = contexts_[i], label = name_ + "-" + std::to_string(i)]() {
            name_current_thread(label);
            try {
                ioc->run();
            } catch (const std::exception& e) {
                spdlog::critical("[{}] thread exception: {}", label, e.what());
            }
        });
    }
}

void TransferPool::Stop() {
    if (stopped_.exchange(true)) {
        return;
    }
    guards_.clear();
    for (const auto& ioc : contexts_) {
        ioc->stop();
    }
    spdlog::debug("{} pool stopped.", name_);
}

asio::io_context& TransferPool::NextContext() {
    const std::size_t idx = next_.fetch_add(1, std::memory_order_relaxed) % contexts_.size();
    return *contexts_[idx];
}

}  // namespace courier::infra
