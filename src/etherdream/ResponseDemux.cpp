#include "etherstream/etherdream/ResponseDemux.hpp"

#include <iterator>

namespace etherstream::etherdream {

void ResponseDemux::feed(const std::uint8_t* data, std::size_t size) {
    if (data && size > 0) {
        std::lock_guard lock(mutex);
        inbound.insert(inbound.end(), data, data + size);
    }
    deliver();
}

void ResponseDemux::expect(PendingResponse pending) {
    {
        std::lock_guard lock(mutex);
        this->pending.push_back(std::move(pending));
    }
    deliver();
}

void ResponseDemux::deliver() {
    std::unique_lock lock(mutex);
    if (delivering) {
        // The thread already delivering will pick up whatever we just added.
        return;
    }
    delivering = true;

    // Clears the flag however the loop exits, including a throwing completion.
    struct DeliveringGuard {
        std::unique_lock<std::mutex>& lock;
        bool& delivering;
        ~DeliveringGuard() {
            if (!lock.owns_lock()) {
                lock.lock();
            }
            delivering = false;
        }
    } guard{lock, delivering};

    while (!pending.empty() && inbound.size() >= pending.front().size) {
        PendingResponse head = std::move(pending.front());
        pending.pop_front();

        const auto end = inbound.begin() + static_cast<std::ptrdiff_t>(head.size);
        Bytes reply(inbound.begin(), end);
        inbound.erase(inbound.begin(), end);

        lock.unlock();
        if (head.complete) {
            head.complete(std::move(reply));
        }
        lock.lock();
    }
}

void ResponseDemux::reset() {
    std::deque<PendingResponse> dropped;
    {
        std::lock_guard lock(mutex);
        inbound.clear();
        dropped.swap(pending);
    }
    // Destroy completions outside the lock: releasing a promise wakes its waiter.
}

std::size_t ResponseDemux::bufferedBytes() const {
    std::lock_guard lock(mutex);
    return inbound.size();
}

std::size_t ResponseDemux::pendingCount() const {
    std::lock_guard lock(mutex);
    return pending.size();
}

} // namespace etherstream::etherdream
