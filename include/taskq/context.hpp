#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace taskq
{

/*! \brief Cancellation and deadline context handed to every task.
 *
 * A context is a cheap value: a stop token plus an optional deadline.
 * The queue forwards it verbatim and never inspects it; honoring it is
 * up to the task.
 */
class context
{
public:
  using clock = std::chrono::steady_clock;

  context() = default;

  explicit context( std::stop_token token, std::optional<clock::time_point> deadline = std::nullopt )
    : token_( std::move( token ) )
    , deadline_( deadline )
  {}

  /*! \brief A context that is never stopped and has no deadline. */
  static context background()
  {
    return context{};
  }

  bool stop_requested() const
  {
    return token_.stop_requested();
  }

  bool has_deadline() const
  {
    return deadline_.has_value();
  }

  /*! \brief Returns the deadline (requires `has_deadline()`). */
  clock::time_point deadline() const
  {
    return *deadline_;
  }

  bool expired() const
  {
    return deadline_ && clock::now() >= *deadline_;
  }

  /*! \brief True once the context was stopped or its deadline passed. */
  bool done() const
  {
    return stop_requested() || expired();
  }

  std::stop_token const& token() const
  {
    return token_;
  }

  /*! \brief Blocks for `duration` unless the context becomes done first.
   *
   * \return true if the full duration elapsed
   */
  template<class Rep, class Period>
  bool wait_for( std::chrono::duration<Rep, Period> const& duration ) const;

private:
  std::stop_token token_;
  std::optional<clock::time_point> deadline_;
}; /* context */

/*! \brief Derives a context whose deadline is the earlier of `parent`'s and `tp`. */
inline context with_deadline( context const& parent, context::clock::time_point tp )
{
  if ( parent.has_deadline() && parent.deadline() < tp )
  {
    tp = parent.deadline();
  }
  return context( parent.token(), tp );
}

template<class Rep, class Period>
context with_timeout( context const& parent, std::chrono::duration<Rep, Period> const& timeout )
{
  return with_deadline( parent, context::clock::now() + std::chrono::ceil<context::clock::duration>( timeout ) );
}

/*! \brief Owner of a stop source that hands out contexts.
 *
 * A source created from a parent context inherits the parent's deadline
 * and is stopped when the parent is.
 */
class context_source
{
public:
  context_source() = default;

  explicit context_source( context const& parent )
    : deadline_( parent.has_deadline() ? std::optional( parent.deadline() ) : std::nullopt )
  {
    link_.emplace( parent.token(), forward_stop{source_} );
  }

  explicit context_source( context::clock::time_point deadline )
    : deadline_( deadline )
  {}

  context_source( context_source const& ) = delete;
  context_source& operator=( context_source const& ) = delete;

  context get_context() const
  {
    return context( source_.get_token(), deadline_ );
  }

  bool request_stop()
  {
    return source_.request_stop();
  }

private:
  struct forward_stop
  {
    std::stop_source source;

    void operator()() noexcept
    {
      source.request_stop();
    }
  }; /* forward_stop */

  std::stop_source source_;
  std::optional<context::clock::time_point> deadline_;
  std::optional<std::stop_callback<forward_stop>> link_;
}; /* context_source */

/*! \brief Sleeps for `duration` unless `ctx` becomes done first.
 *
 * \return true if the full duration elapsed, false if the context was
 *         stopped or its deadline cut the sleep short
 */
template<class Rep, class Period>
bool sleep_for( context const& ctx, std::chrono::duration<Rep, Period> const& duration )
{
  auto const until = context::clock::now() + std::chrono::ceil<context::clock::duration>( duration );
  auto const wake = ( ctx.has_deadline() && ctx.deadline() < until ) ? ctx.deadline() : until;

  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock lock( m );
  cv.wait_until( lock, ctx.token(), wake, []{ return false; } );

  return !ctx.stop_requested() && wake == until;
}

template<class Rep, class Period>
bool context::wait_for( std::chrono::duration<Rep, Period> const& duration ) const
{
  return sleep_for( *this, duration );
}

} // taskq
