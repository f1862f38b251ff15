#include "etherstream/etherdream/BatchPlanner.hpp"
#include "etherstream/etherdream/EtherDreamConfig.hpp"

namespace etherstream::etherdream {

BatchPlan planBatch(std::uint16_t bufferFullness) {
    const std::size_t fullness = bufferFullness;
    const std::size_t capacity = config::ETHERDREAM_BUFFER_CAPACITY;

    BatchPlan plan;
    plan.capacity = capacity > fullness ? capacity - fullness : 0;
    if (plan.capacity < config::ETHERDREAM_THROTTLE_THRESHOLD) {
        plan.throttled = true;
        plan.capacity += config::ETHERDREAM_THROTTLE_PADDING;
    }
    return plan;
}

} // namespace etherstream::etherdream
