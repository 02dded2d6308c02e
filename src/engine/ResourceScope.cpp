#include "engine/ResourceScope.hpp"

#include <stdexcept>

namespace pd::engine
{

BoundedResourcePool::BoundedResourcePool(std::size_t capacity)
    : capacity_(capacity)
{
    if (capacity_ == 0)
    {
        throw std::invalid_argument("resource pool capacity must be positive");
    }
}

void BoundedResourcePool::acquire()
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < capacity_; });
    ++in_use_;
}

void BoundedResourcePool::release() noexcept
{
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (in_use_ > 0)
        {
            --in_use_;
        }
    }
    cv_.notify_one();
}

std::size_t BoundedResourcePool::in_use() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return in_use_;
}

} // namespace pd::engine
