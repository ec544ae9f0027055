#pragma once

#include <atomic>
#include <cstdint>

namespace taskq
{

/*! \brief A FIFO-fair mutex.
 *
 * Every call to `lock()` draws a ticket; tickets are served in the order
 * in which they were drawn.  Waiting threads block on the serving counter
 * instead of spinning.
 *
 * Satisfies the Lockable requirements.
 */
struct ticket_mutex
{
public:
  ticket_mutex() = default;

  ticket_mutex( ticket_mutex const& ) = delete;
  ticket_mutex& operator=( ticket_mutex const& ) = delete;

  void lock()
  {
    auto const my = in.fetch_add( 1u, std::memory_order_acquire );
    while ( true )
    {
      auto const now = out.load( std::memory_order_acquire );
      if ( now == my )
      {
        return;
      }
      out.wait( now, std::memory_order_relaxed );
    }
  }

  bool try_lock()
  {
    /* succeeds only if nobody holds or waits for the mutex */
    auto const now = out.load( std::memory_order_acquire );
    auto expected = now;
    return in.compare_exchange_strong( expected, now + 1u, std::memory_order_acquire, std::memory_order_relaxed );
  }

  void unlock()
  {
    out.fetch_add( 1u, std::memory_order_release );
    out.notify_all();
  }

private:
  std::atomic<std::uint32_t> in{0u};
  std::atomic<std::uint32_t> out{0u};
}; /* ticket_mutex */

} // taskq
