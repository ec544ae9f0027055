#pragma once

#include "context.hpp"
#include "diagnostics.hpp"
#include "idle_signal.hpp"
#include "ticket_mutex.hpp"

#include <any_invocable/any_invocable.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace taskq
{

/*! \brief Thrown when a queue is constructed with a limit below one or above `UINT32_MAX`. */
class invalid_capacity : public std::invalid_argument
{
public:
  explicit invalid_capacity( std::int64_t max_active )
    : std::invalid_argument( fmt::format( "bounded_fifo_queue called with invalid limit ({})", max_active ) )
    , max_active_( max_active )
  {}

  std::int64_t max_active() const
  {
    return max_active_;
  }

private:
  std::int64_t max_active_;
}; /* invalid_capacity */

struct queue_params
{
  /*! \brief Name used to prefix diagnostics. */
  std::string name{"taskq"};

  /*! \brief Report worker start and retirement as notes. */
  bool verbose{false};

  /*! \brief Diagnostics engine (default engine if null); must outlive the queue. */
  diagnostics const* diag{nullptr};

  /*! \brief Starts a worker on a new thread (detached `std::thread` if empty).
   *
   * Must either start the worker or throw `std::system_error` without
   * running it.
   */
  std::function<void( std::function<void()> )> start_worker;
}; /* queue_params */

struct queue_stats
{
  /*! \brief Number of calls to submit. */
  std::uint64_t submitted{0};

  /*! \brief Tasks that started a new worker right away. */
  std::uint64_t started{0};

  /*! \brief Tasks that had to wait in the backlog. */
  std::uint64_t backlogged{0};

  /*! \brief Tasks that returned normally. */
  std::uint64_t completed{0};

  /*! \brief Tasks that exited with an exception. */
  std::uint64_t faulted{0};

  /*! \brief Submissions run on the calling thread because no worker could be started. */
  std::uint64_t caller_runs{0};

  /*! \brief High-water mark of the backlog. */
  std::uint64_t max_backlog{0};
}; /* queue_stats */

/*! \brief Concurrency-limited FIFO work queue.
 *
 * At most `max_active` submitted tasks run at the same time, each on its
 * own worker thread.  Tasks submitted while the limit is reached wait in
 * a backlog and are started in submission order.  A worker that finishes
 * a task takes over the next backlog entry itself, so no thread is spawned
 * per backlogged task and no dispatcher thread exists.
 *
 * The destructor blocks until the queue is idle.  It must therefore not
 * run on one of the queue's own workers: releasing the last owner of a
 * queue from inside one of its tasks never returns, because that task
 * still occupies a slot.
 */
class bounded_fifo_queue
{
public:
  using task_type = ofats::any_invocable<void( context const& )>;

public:
  explicit bounded_fifo_queue( std::int64_t max_active, queue_params const& ps = {} )
    : core_( make_core( max_active, ps ) )
  {}

  ~bounded_fifo_queue()
  {
    idle()->wait();
  }

  bounded_fifo_queue( bounded_fifo_queue const& ) = delete;
  bounded_fifo_queue& operator=( bounded_fifo_queue const& ) = delete;

  /*! \brief Submits a task; never blocks on other tasks.
   *
   * If fewer than `max_active` tasks are running, a new worker starts
   * `task( ctx )` immediately.  Otherwise, the task is appended to the
   * backlog together with `ctx`.
   *
   * A task that throws is reported through the diagnostics engine and
   * counted as faulted; the queue keeps draining its backlog.
   */
  void submit( context ctx, task_type task )
  {
    {
      std::scoped_lock lock( core_->mutex );
      auto& st = core_->st;
      ++st.stats.submitted;

      if ( st.active == core_->max_active )
      {
        st.backlog.push_back( pending{std::move( ctx ), std::move( task )} );
        ++st.stats.backlogged;
        st.stats.max_backlog = std::max<std::uint64_t>( st.stats.max_backlog, st.backlog.size() );
        return;
      }

      if ( st.active == 0u )
      {
        /* mark the queue as non-idle; the next idle() call subscribes anew */
        st.idle.reset();
      }

      ++st.active;
      ++st.stats.started;
    }

    spawn( pending{std::move( ctx ), std::move( task )} );
  }

  void submit( task_type task )
  {
    submit( context::background(), std::move( task ) );
  }

  /*! \brief Returns the signal raised when the queue becomes idle.
   *
   * The returned signal is already fired if the queue is idle.  While the
   * queue stays busy, repeated calls return the same signal.
   */
  std::shared_ptr<idle_signal> idle()
  {
    std::scoped_lock lock( core_->mutex );
    auto& st = core_->st;
    if ( !st.idle )
    {
      st.idle = std::make_shared<idle_signal>( st.active == 0u );
    }
    return st.idle;
  }

  /*! \brief Number of tasks waiting in the backlog (running tasks excluded). */
  std::uint64_t backlog_size() const
  {
    std::scoped_lock lock( core_->mutex );
    return core_->st.backlog.size();
  }

  std::uint32_t max_active() const
  {
    return core_->max_active;
  }

  queue_stats stats() const
  {
    std::scoped_lock lock( core_->mutex );
    return core_->st.stats;
  }

private:
  struct pending
  {
    context ctx;
    task_type task;
  }; /* pending */

  struct state
  {
    std::uint32_t active{0u};
    std::deque<pending> backlog;
    std::shared_ptr<idle_signal> idle;
    queue_stats stats;
  }; /* state */

  /* shared by the queue and its workers, so a retiring worker may still
     release the mutex after the queue has been destroyed */
  struct shared_core
  {
    shared_core( std::uint32_t max_active, queue_params const& ps, diagnostics const& diag )
      : max_active( max_active )
      , ps( ps )
      , diag( diag )
    {}

    std::uint32_t const max_active;
    queue_params const ps;
    diagnostics const& diag;

    mutable ticket_mutex mutex;
    state st;
  }; /* shared_core */

  static std::shared_ptr<shared_core> make_core( std::int64_t max_active, queue_params const& ps )
  {
    if ( max_active < 1 || max_active > std::int64_t( UINT32_MAX ) )
    {
      throw invalid_capacity( max_active );
    }

    static diagnostics const default_diag;
    return std::make_shared<shared_core>( static_cast<std::uint32_t>( max_active ), ps, ps.diag ? *ps.diag : default_diag );
  }

  void spawn( pending job )
  {
    auto owned = std::make_unique<pending>( std::move( job ) );
    try
    {
      auto worker = [core = core_, p = owned.get()]{
        run_worker( *core, std::move( *std::unique_ptr<pending>( p ) ) );
      };
      if ( core_->ps.start_worker )
      {
        core_->ps.start_worker( std::move( worker ) );
      }
      else
      {
        std::thread( std::move( worker ) ).detach();
      }
      owned.release();
    }
    catch ( std::system_error const& e )
    {
      /* the slot is already accounted for; run the worker loop here instead */
      core_->diag.report( diagnostic_level::warning, "[{}] cannot start worker ({}), running task on the calling thread", core_->ps.name, e.what() );
      {
        std::scoped_lock lock( core_->mutex );
        ++core_->st.stats.caller_runs;
      }
      run_worker( *core_, std::move( *owned ) );
    }
  }

  static bool invoke( shared_core const& core, pending& job )
  {
    try
    {
      job.task( job.ctx );
      return true;
    }
    catch ( std::exception const& e )
    {
      core.diag.report( diagnostic_level::error, "[{}] task failed: {}", core.ps.name, e.what() );
    }
    catch ( ... )
    {
      core.diag.report( diagnostic_level::error, "[{}] task failed with an unknown exception", core.ps.name );
    }
    return false;
  }

  static bool take_next( state& st, std::optional<pending>& job )
  {
    if ( st.backlog.empty() )
    {
      return false;
    }
    job.emplace( std::move( st.backlog.front() ) );
    st.backlog.pop_front();
    return true;
  }

  static void retire( state& st )
  {
    if ( --st.active == 0u && st.idle )
    {
      st.idle->fire();
    }
  }

  static void run_worker( shared_core& core, pending first )
  {
    if ( core.ps.verbose )
    {
      core.diag.report( diagnostic_level::note, "[{}] worker started", core.ps.name );
    }

    std::optional<pending> job( std::move( first ) );
    while ( job )
    {
      bool const ok = invoke( core, *job );

      /* destroy the finished task outside of the critical section */
      job.reset();

      {
        std::scoped_lock lock( core.mutex );
        ++( ok ? core.st.stats.completed : core.st.stats.faulted );

        if ( take_next( core.st, job ) )
        {
          continue;
        }
        if ( !core.ps.verbose )
        {
          retire( core.st );
          return;
        }
      }

      /* report while the slot is still held: once it is given back, the
         queue and its diagnostics engine may be destroyed */
      core.diag.report( diagnostic_level::note, "[{}] worker retiring", core.ps.name );

      std::scoped_lock lock( core.mutex );
      if ( !take_next( core.st, job ) )
      {
        retire( core.st );
      }
    }
  }

private:
  std::shared_ptr<shared_core> core_;
}; /* bounded_fifo_queue */

} // taskq
