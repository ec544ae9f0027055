#include <taskq/bounded_fifo_queue.hpp>

#include <atomic>
#include <chrono>
#include <iostream>
#include <latch>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main()
{
  taskq::idle_signal const fired( true );
  if ( !fired.is_fired() || !fired.wait_for( 0ms ) )
  {
    std::cerr << "idle_signal: signal created fired is not fired\n";
    return 1;
  }
  fired.wait();

  taskq::idle_signal const pending;
  if ( pending.is_fired() || pending.wait_for( 10ms ) )
  {
    std::cerr << "idle_signal: fresh signal reports fired\n";
    return 2;
  }

  taskq::context_source source;
  source.request_stop();
  if ( pending.wait( source.get_context() ) )
  {
    std::cerr << "idle_signal: wait on a stopped context reported fired\n";
    return 3;
  }

  if ( pending.wait( taskq::with_timeout( taskq::context::background(), 10ms ) ) )
  {
    std::cerr << "idle_signal: wait past the deadline reported fired\n";
    return 4;
  }

  /* many waiters are released by a single idle transition */
  std::latch unblock( 1 );
  taskq::bounded_fifo_queue q( 2 );
  q.submit( [&]( taskq::context const& ){ unblock.wait(); } );

  auto const signal = q.idle();
  std::atomic<std::uint32_t> released{0};
  {
    std::vector<std::jthread> waiters;
    for ( auto i = 0; i < 4; ++i )
    {
      waiters.emplace_back( [&]{
        if ( signal->wait( taskq::with_timeout( taskq::context::background(), 10s ) ) )
        {
          ++released;
        }
      } );
    }
    unblock.count_down();
  }

  if ( released != 4u )
  {
    std::cerr << "idle_signal: only " << released << " of 4 waiters were released\n";
    return 5;
  }

  std::cout << "test_idle_signal: OK\n";
  return 0;
}
