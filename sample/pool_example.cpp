/// \file pool_example.cpp
/// \brief Example showing an elastic Vthreads pool under a burst of work.
///
/// The program:
///
/// - Builds a pool with two resident workers and room for four, either with
///   defaults or from a TOML file given as the first argument (see the
///   [pool] and [log] tables documented in PoolConfig::fromConfig).
/// - Submits ten 50 ms jobs at once and waits on every Future, printing the
///   wall time. With four workers it is close to three rounds of 50 ms.
/// - Shows error capture: a job that throws surfaces the same exception
///   from Future::get().
/// - Serialises updates to a shared counter through a LockRegistry and a
///   Locked wrapper dispatched with makeAsync.
/// - Prints the pool's JSON snapshot, then shuts down and joins.

#include "vthreads/vthreads.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace vthreads::core;

namespace
{

std::unique_ptr<ThreadPool> buildPool(int argc, char **argv)
{
  if (argc > 1)
  {
    return vthreads::makePoolFromFile(argv[1]);
  }
  Logger::init(Logger::Level::Info);
  PoolConfig config;
  config.name = "example";
  config.minThreads = 2;
  config.maxThreads = 4;
  return std::make_unique<ThreadPool>(config);
}

} // namespace

int main(int argc, char **argv)
{
  std::unique_ptr<ThreadPool> pool;
  try
  {
    pool = buildPool(argc, argv);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Cannot create pool: " << e.what() << std::endl;
    return 1;
  }

  VTHREADS_LOG_INFO("Vthreads " << VTHREADS_VERSION_STRING << " example, pool '" << pool->name()
                                << "' (" << pool->minThreads() << ".." << pool->maxThreads()
                                << " workers)");

  // Burst of ten sleeping jobs.
  const auto start = std::chrono::steady_clock::now();
  std::vector<Future<int>> results;
  for (int i = 0; i < 10; ++i)
  {
    results.push_back(pool->submit(
      [i]()
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return i * i;
      }));
  }
  int sum = 0;
  for (auto &f : results)
  {
    sum += f.get();
  }
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start);
  std::cout << "10 jobs, sum of squares " << sum << ", " << elapsed.count() << " ms on "
            << pool->stats().peakLive << " workers" << std::endl;

  // Captured error.
  auto failing = pool->submit([]() -> int { throw std::runtime_error("bad input"); });
  try
  {
    failing.get();
  }
  catch (const std::runtime_error &e)
  {
    std::cout << "job failed as expected: " << e.what() << std::endl;
  }

  // Serialised counter updates.
  LockRegistry registry;
  int counter = 0;
  auto increment = makeAsync(*pool, makeLocked(registry.lockFor(counter), [&counter]() {
    int seen = counter;
    std::this_thread::yield();
    counter = seen + 1;
  }));
  std::vector<Future<void>> increments;
  for (int i = 0; i < 100; ++i)
  {
    increments.push_back(increment());
  }
  for (auto &f : increments)
  {
    f.get();
  }
  std::cout << "counter = " << counter << std::endl;

  std::cout << pool->toJson().dump(2) << std::endl;

  pool->shutdown();
  pool->join();
  Logger::shutdown();
  return 0;
}
