#pragma once

#include "context.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace taskq
{

class bounded_fifo_queue;

/*! \brief One-shot broadcast raised when a queue becomes idle.
 *
 * Once fired, a signal stays fired; any number of threads may wait on it.
 * Only the owning queue can fire it.
 */
class idle_signal
{
public:
  explicit idle_signal( bool fired = false )
    : fired_( fired )
  {}

  idle_signal( idle_signal const& ) = delete;
  idle_signal& operator=( idle_signal const& ) = delete;

  bool is_fired() const
  {
    std::scoped_lock lock( mutex_ );
    return fired_;
  }

  void wait() const
  {
    std::unique_lock lock( mutex_ );
    cv_.wait( lock, [this]{ return fired_; } );
  }

  /*! \brief Waits until fired or until `ctx` is done.
   *
   * \return true if the signal fired
   */
  bool wait( context const& ctx ) const
  {
    std::unique_lock lock( mutex_ );
    if ( ctx.has_deadline() )
    {
      return cv_.wait_until( lock, ctx.token(), ctx.deadline(), [this]{ return fired_; } );
    }
    return cv_.wait( lock, ctx.token(), [this]{ return fired_; } );
  }

  template<class Rep, class Period>
  bool wait_for( std::chrono::duration<Rep, Period> const& timeout ) const
  {
    std::unique_lock lock( mutex_ );
    return cv_.wait_for( lock, timeout, [this]{ return fired_; } );
  }

private:
  friend class bounded_fifo_queue;

  void fire()
  {
    {
      std::scoped_lock lock( mutex_ );
      fired_ = true;
    }
    cv_.notify_all();
  }

private:
  mutable std::mutex mutex_;
  mutable std::condition_variable_any cv_;
  bool fired_;
}; /* idle_signal */

} // taskq
