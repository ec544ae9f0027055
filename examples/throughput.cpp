#include <taskq/bounded_fifo_queue.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

int main()
{
  std::atomic<std::uint64_t> count( 0 );

  auto const start = std::chrono::steady_clock::now();
  {
    taskq::bounded_fifo_queue q( 10 );
    for ( auto i = 0; i < 1'000'000; ++i )
    {
      q.submit( [&]( taskq::context const& ){
        std::string s = "new string";
        s.append( "new" );
        ++count;
      } );
    }

    q.idle()->wait();

    auto const st = q.stats();
    std::cout << "workers started: " << st.started << '\n'
              << "max backlog:     " << st.max_backlog << '\n';
  }
  auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>( std::chrono::steady_clock::now() - start );

  std::cout << count << " tasks in " << elapsed.count() << " ms" << '\n';

  return 0;
}
