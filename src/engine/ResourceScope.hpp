#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace pd::engine
{

// Shared backing resource checked out around every execution of a work unit
// (a pooled connection, a license slot, ...).
class ResourceScope
{
  public:
    virtual ~ResourceScope() = default;
    virtual void acquire() = 0;
    virtual void release() noexcept = 0;
};

// Holds a checkout for its lifetime. A null scope is allowed and does nothing.
class ScopedResource
{
  public:
    explicit ScopedResource(ResourceScope *scope) : scope_(scope)
    {
        if (scope_)
        {
            scope_->acquire();
        }
    }
    ~ScopedResource()
    {
        if (scope_)
        {
            scope_->release();
        }
    }
    ScopedResource(ScopedResource const &) = delete;
    ScopedResource &operator=(ScopedResource const &) = delete;

  private:
    ResourceScope *scope_;
};

// Fixed number of slots; acquire() blocks while all are checked out.
class BoundedResourcePool final : public ResourceScope
{
  public:
    explicit BoundedResourcePool(std::size_t capacity);

    void acquire() override;
    void release() noexcept override;

    std::size_t in_use() const;
    std::size_t capacity() const noexcept { return capacity_; }

  private:
    std::size_t const capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_use_ = 0;
};

} // namespace pd::engine
