// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the reentrant, inspectable VLock

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <vthreads/core/vlock.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace vthreads::core;
using vthreads::test::waitUntil;

TEST_CASE("VLock acquire and release", "[vlock][basic]")
{
  VLock lock;

  REQUIRE_FALSE(lock.isLocked());
  REQUIRE_FALSE(lock.owner().has_value());
  REQUIRE(lock.holdCount() == 0);

  REQUIRE(lock.acquire());
  REQUIRE(lock.isLocked());
  REQUIRE(lock.owner() == std::this_thread::get_id());
  REQUIRE(lock.holdCount() == 1);

  REQUIRE(lock.release());
  REQUIRE_FALSE(lock.isLocked());
  REQUIRE_FALSE(lock.owner().has_value());
}

TEST_CASE("VLock is reentrant for its owner", "[vlock][reentrant]")
{
  VLock lock;

  REQUIRE(lock.acquire());
  REQUIRE(lock.acquire());
  REQUIRE(lock.acquire(false));
  REQUIRE(lock.holdCount() == 3);

  REQUIRE_FALSE(lock.release());
  REQUIRE_FALSE(lock.release());
  REQUIRE(lock.isLocked());
  REQUIRE(lock.release());
  REQUIRE_FALSE(lock.isLocked());
}

TEST_CASE("VLock release by a non-owner throws", "[vlock][error]")
{
  VLock lock;

  SECTION("unlocked")
  {
    REQUIRE_THROWS_AS(lock.release(), NotOwner);
  }

  SECTION("held by another thread")
  {
    lock.acquire();
    std::atomic<bool> threw{false};
    std::thread other(
      [&]()
      {
        try
        {
          lock.release();
        }
        catch (const NotOwner &)
        {
          threw = true;
        }
      });
    other.join();

    REQUIRE(threw.load());
    REQUIRE(lock.owner() == std::this_thread::get_id());
    REQUIRE(lock.holdCount() == 1);
    lock.release();
  }
}

TEST_CASE("VLock non-blocking acquire fails while held elsewhere", "[vlock][try]")
{
  VLock lock;
  lock.acquire();

  std::atomic<int> result{-1};
  std::thread other(
    [&]()
    {
      result = lock.acquire(false) ? 1 : 0;
      result = result.load() + (lock.try_lock() ? 10 : 0);
    });
  other.join();

  REQUIRE(result.load() == 0);
  REQUIRE(lock.waiting().empty());
  lock.release();
}

TEST_CASE("VLock shows blocked threads as waiting", "[vlock][waiting]")
{
  VLock lock;
  lock.acquire();

  std::atomic<bool> acquired{false};
  std::atomic<bool> ownerWasWaiter{false};
  std::atomic<bool> leftWaiting{false};
  std::thread::id waiterId;
  std::thread waiter(
    [&]()
    {
      lock.acquire();
      acquired = true;
      ownerWasWaiter = lock.owner() == std::this_thread::get_id();
      leftWaiting = lock.waiting().empty();
      lock.release();
    });
  waiterId = waiter.get_id();

  REQUIRE(waitUntil([&]() { return lock.waiting().size() == 1; }));
  REQUIRE(lock.waiting().front() == waiterId);
  REQUIRE_FALSE(acquired.load());

  std::ostringstream expected;
  expected << "<VLock owner = " << std::this_thread::get_id() << " waiting = [" << waiterId
           << "] >";
  REQUIRE(lock.describe() == expected.str());

  lock.release();
  waiter.join();

  REQUIRE(acquired.load());
  REQUIRE(ownerWasWaiter.load());
  REQUIRE(leftWaiting.load());
  REQUIRE(lock.waiting().empty());
  REQUIRE_FALSE(lock.isLocked());
  REQUIRE(lock.describe() == "<VLock owner = None waiting = [] >");
}

TEST_CASE("VLock waiting lists threads in attempt order", "[vlock][waiting]")
{
  VLock lock;
  lock.acquire();

  std::vector<std::thread> waiters;
  std::vector<std::thread::id> ids;
  for (int i = 0; i < 3; ++i)
  {
    waiters.emplace_back(
      [&lock]()
      {
        lock.acquire();
        lock.release();
      });
    ids.push_back(waiters.back().get_id());
    REQUIRE(waitUntil([&]() { return lock.waiting().size() == ids.size(); }));
  }

  REQUIRE(lock.waiting() == ids);

  lock.release();
  for (auto &t : waiters)
  {
    t.join();
  }
  REQUIRE(lock.waiting().empty());
}

TEST_CASE("VLock excludes concurrent holders", "[vlock][exclusion]")
{
  VLock lock;
  int counter = 0;
  std::atomic<int> inside{0};
  std::atomic<int> maxInside{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t)
  {
    threads.emplace_back(
      [&]()
      {
        for (int i = 0; i < 500; ++i)
        {
          std::lock_guard<VLock> guard(lock);
          int now = inside.fetch_add(1) + 1;
          int seen = maxInside.load();
          while (now > seen && !maxInside.compare_exchange_weak(seen, now))
          {
          }
          ++counter;
          inside.fetch_sub(1);
        }
      });
  }
  for (auto &t : threads)
  {
    t.join();
  }

  REQUIRE(counter == 8 * 500);
  REQUIRE(maxInside.load() == 1);
  REQUIRE_FALSE(lock.isLocked());
}

TEST_CASE("VLock acquireFor gives up after the timeout", "[vlock][timeout]")
{
  VLock lock;
  lock.acquire();

  std::atomic<int> outcome{-1};
  std::thread other([&]() { outcome = lock.acquireFor(std::chrono::milliseconds(30)) ? 1 : 0; });
  other.join();

  REQUIRE(outcome.load() == 0);
  REQUIRE(lock.waiting().empty());
  REQUIRE(lock.holdCount() == 1);

  lock.release();
  std::thread again(
    [&]()
    {
      outcome = lock.acquireFor(std::chrono::milliseconds(30)) ? 1 : 0;
      if (outcome.load() == 1)
      {
        lock.release();
      }
    });
  again.join();
  REQUIRE(outcome.load() == 1);
}

TEST_CASE("VLock works with std::unique_lock", "[vlock][lockable]")
{
  VLock lock;
  {
    std::unique_lock<VLock> guard(lock);
    REQUIRE(guard.owns_lock());
    REQUIRE(lock.isLocked());
    guard.unlock();
    REQUIRE_FALSE(lock.isLocked());
    REQUIRE(guard.try_lock());
  }
  REQUIRE_FALSE(lock.isLocked());
}
