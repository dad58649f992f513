#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <new>
#include <thread>

// Bounded single-producer/single-consumer channel between a market-data callback thread and the
// pipeline consumer of one symbol.
//   * Capacity is a power of two so indices wrap with a mask.
//   * Slots live in one heap block sized at construction; events carry strings, so keeping them
//     off the owner's stack matters.
//   * Producer release-stores tail after constructing an element; consumer acquire-loads tail
//     before reading it. Head is the mirror image.
//   * A full queue pushes back on the producer (push_wait) instead of growing.
namespace tbot::spsc
{
template <typename T, std::size_t CapacityPow2> class Queue
{
  static_assert((CapacityPow2 & (CapacityPow2 - 1)) == 0, "Capacity must be a power of two");
  static_assert(CapacityPow2 > 0, "Capacity must be non-zero");
  static constexpr std::size_t kMask = CapacityPow2 - 1;

  // Next element to consume. Written by the consumer only.
  alignas(64) std::atomic<std::size_t> _head{0};
  // Next free slot. Written by the producer only.
  alignas(64) std::atomic<std::size_t> _tail{0};
  // Raw room for one element; constructed on push, destroyed on pop.
  struct Slot
  {
    alignas(T) unsigned char bytes[sizeof(T)];
  };
  std::unique_ptr<Slot[]> _storage;

  T *slot(std::size_t index) noexcept
  {
    return std::launder(reinterpret_cast<T *>(_storage[index & kMask].bytes));
  }

  template <typename U> bool emplace(U &&v)
  {
    const std::size_t t = _tail.load(std::memory_order_relaxed);
    const std::size_t h = _head.load(std::memory_order_acquire);
    if ((t - h) >= CapacityPow2) // full
      return false;
    new (slot(t)) T(std::forward<U>(v));
    _tail.store(t + 1, std::memory_order_release);
    return true;
  }

public:
  Queue() : _storage(std::make_unique<Slot[]>(CapacityPow2)) {}
  Queue(const Queue &) = delete;
  Queue &operator=(const Queue &) = delete;

  ~Queue()
  {
    std::size_t h = _head.load(std::memory_order_relaxed);
    const std::size_t t = _tail.load(std::memory_order_relaxed);
    while (h != t)
    {
      slot(h)->~T();
      ++h;
    }
  }

  static constexpr std::size_t capacity() noexcept
  {
    return CapacityPow2;
  }

  bool push(const T &v)
  {
    return emplace(v);
  }

  bool push(T &&v)
  {
    return emplace(std::move(v));
  }

  // Blocks the producer while the queue is full. Gives up only when `keep_waiting` turns false,
  // which is how a stopping consumer releases a producer stuck on a full queue.
  template <typename U> bool push_wait(U &&v, const std::atomic<bool> &keep_waiting)
  {
    while (!emplace(v))
    {
      if (!keep_waiting.load(std::memory_order_acquire))
        return false;
      std::this_thread::yield();
    }
    return true;
  }

  bool pop(T &out)
  {
    const std::size_t h = _head.load(std::memory_order_relaxed);
    const std::size_t t = _tail.load(std::memory_order_acquire);
    if (h == t) // empty
      return false;
    T *s = slot(h);
    out = std::move(*s);
    s->~T();
    _head.store(h + 1, std::memory_order_release);
    return true;
  }

  bool empty() const noexcept
  {
    return _head.load(std::memory_order_acquire) == _tail.load(std::memory_order_acquire);
  }

  std::size_t size() const noexcept
  {
    const std::size_t h = _head.load(std::memory_order_acquire);
    const std::size_t t = _tail.load(std::memory_order_acquire);
    return t - h;
  }
};
} // namespace tbot::spsc
