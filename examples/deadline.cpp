#include <taskq/bounded_fifo_queue.hpp>

#include <chrono>
#include <iostream>

/* Three sleeping tasks on a queue that runs two at a time, raced against
   a deadline that expires before the backlog can drain. */
int main()
{
  using namespace std::chrono_literals;

  taskq::context_source source( taskq::context::clock::now() + 4s );
  auto const ctx = source.get_context();

  taskq::bounded_fifo_queue q( 2, {.name = "deadline", .verbose = true} );

  for ( auto const d : { 5s, 3s, 6s } )
  {
    q.submit( ctx, [d]( taskq::context const& c ){
      if ( taskq::sleep_for( c, d ) )
      {
        std::cout << d.count() << " sleep" << std::endl;
      }
      else
      {
        std::cout << d.count() << " sleep cancelled" << std::endl;
      }
    } );
  }

  if ( q.idle()->wait( ctx ) )
  {
    std::cout << "Working" << std::endl;
  }
  else
  {
    std::cout << "Done" << std::endl;
  }

  return 0;
}
