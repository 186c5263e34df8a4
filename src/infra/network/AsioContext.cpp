#include "infra/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace camlink::infra {

namespace {

constexpr size_t MAX_THREAD_NAME = 15;

void nameCurrentThread(const std::string& name) {
#if defined(__linux__)
    pthread_setname_np(pthread_self(), name.substr(0, MAX_THREAD_NAME).c_str());
#else
    (void)name;
#endif
}

} // namespace

AsioContext::AsioContext(size_t threadCount, std::string name)
    : threadCount_(threadCount > 0 ? threadCount : 1), name_(std::move(name)) {
    spdlog::debug("Pool {} sized for {} threads", name_, threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::runWorker(size_t index) {
    auto threadName = fmt::format("{}-{}", name_, index);
    nameCurrentThread(threadName);
    spdlog::debug("{} started", threadName);

    for (;;) {
        try {
            ioContext_.run();
            break;
        } catch (const std::exception& e) {
            ++handlerFailures_;
            spdlog::error("{}: handler threw, worker continues: {}", threadName, e.what());
        }
    }

    spdlog::debug("{} stopped", threadName);
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i] { runWorker(i); });
    }

    spdlog::info("Pool {} running {} workers", name_, threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("Pool {} stopped ({} handler failures)", name_, handlerFailures_.load());
}

} // namespace camlink::infra
