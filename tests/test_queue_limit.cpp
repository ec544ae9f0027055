#include <taskq/bounded_fifo_queue.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

int main()
{
  for ( auto const max_active : { 1u, 2u, 4u, 7u } )
  {
    constexpr auto num_tasks = 200u;

    std::atomic<std::uint32_t> running{0};
    std::atomic<std::uint32_t> peak{0};
    std::atomic<std::uint32_t> ran{0};

    {
      taskq::bounded_fifo_queue q( max_active );

      /* submit from several threads at once */
      std::vector<std::jthread> producers;
      for ( auto p = 0u; p < 4u; ++p )
      {
        producers.emplace_back( [&]{
          for ( auto i = 0u; i < num_tasks / 4u; ++i )
          {
            q.submit( [&]( taskq::context const& ){
              auto const now = ++running;
              auto seen = peak.load();
              while ( now > seen && !peak.compare_exchange_weak( seen, now ) )
              {
              }
              std::this_thread::sleep_for( 100us );
              --running;
              ++ran;
            } );
          }
        } );
      }
      producers.clear();

      q.idle()->wait();

      auto const st = q.stats();
      if ( st.submitted != num_tasks || st.started + st.backlogged != num_tasks || st.completed != num_tasks )
      {
        std::cerr << "queue_limit: inconsistent stats for max_active " << max_active << "\n";
        return 1;
      }
      if ( st.started < 1u || q.backlog_size() != 0u )
      {
        return 2;
      }
    }

    if ( ran != num_tasks )
    {
      std::cerr << "queue_limit: " << ran << " of " << num_tasks << " tasks ran\n";
      return 3;
    }
    if ( peak > max_active || peak == 0u )
    {
      std::cerr << "queue_limit: " << peak << " tasks ran at once with max_active " << max_active << "\n";
      return 4;
    }
  }

  std::cout << "test_queue_limit: OK\n";
  return 0;
}
