// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// Tests for the unbounded FIFO BlockingQueue

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <vthreads/core/blocking_queue.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace vthreads::core;

// ══════════════════════════════════════════════════════════════════════════
// Test: Basic Push/Pop Operations
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue pops in FIFO order", "[blocking_queue][basic]")
{
  BlockingQueue<int> queue;

  REQUIRE(queue.size() == 0);

  queue.push(1);
  queue.push(2);
  queue.push(3);
  REQUIRE(queue.size() == 3);

  int value = 0;
  queue.pop(value);
  REQUIRE(value == 1);
  queue.pop(value);
  REQUIRE(value == 2);
  REQUIRE(queue.tryPop(value));
  REQUIRE(value == 3);
  REQUIRE(queue.size() == 0);
  REQUIRE_FALSE(queue.tryPop(value));
}

TEST_CASE("BlockingQueue move semantics", "[blocking_queue][move]")
{
  BlockingQueue<std::string> queue;

  std::string item = "hello";
  queue.push(std::move(item));

  std::string out;
  REQUIRE(queue.tryPop(out));
  REQUIRE(out == "hello");
  REQUIRE_FALSE(queue.tryPop(out));
}

TEST_CASE("BlockingQueue grows without bound", "[blocking_queue][unbounded]")
{
  BlockingQueue<int> queue;
  for (int i = 0; i < 10000; ++i)
  {
    queue.push(i);
  }
  REQUIRE(queue.size() == 10000);
}

// ══════════════════════════════════════════════════════════════════════════
// Test: Blocking
// ══════════════════════════════════════════════════════════════════════════

TEST_CASE("BlockingQueue pop waits for a producer", "[blocking_queue][blocking]")
{
  BlockingQueue<int> queue;
  std::atomic<int> received{0};

  std::thread consumer(
    [&]()
    {
      int v = 0;
      queue.pop(v);
      received = v;
    });

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(received.load() == 0);

  queue.push(5);
  consumer.join();
  REQUIRE(received.load() == 5);
}

TEST_CASE("BlockingQueue stop markers release blocked consumers", "[blocking_queue][stop]")
{
  BlockingQueue<int> queue;
  constexpr int stop = -1;
  std::atomic<int> stopped{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 3; ++i)
  {
    consumers.emplace_back(
      [&]()
      {
        int v = 0;
        do
        {
          queue.pop(v);
        } while (v != stop);
        stopped.fetch_add(1);
      });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  REQUIRE(stopped.load() == 0);

  queue.push(7);
  for (int i = 0; i < 3; ++i)
  {
    queue.push(stop);
  }
  for (auto &t : consumers)
  {
    t.join();
  }
  REQUIRE(stopped.load() == 3);
  REQUIRE(queue.size() == 0);
}

TEST_CASE("BlockingQueue concurrent producers and consumers", "[blocking_queue][concurrent]")
{
  BlockingQueue<int> queue;
  constexpr int producers = 4;
  constexpr int perProducer = 250;
  constexpr int consumers = 2;
  std::atomic<int> consumed{0};
  std::atomic<long> total{0};

  std::vector<std::thread> threads;
  for (int p = 0; p < producers; ++p)
  {
    threads.emplace_back(
      [&queue]()
      {
        for (int i = 1; i <= perProducer; ++i)
        {
          queue.push(i);
        }
      });
  }
  for (int c = 0; c < consumers; ++c)
  {
    threads.emplace_back(
      [&]()
      {
        for (int i = 0; i < producers * perProducer / consumers; ++i)
        {
          int v = 0;
          queue.pop(v);
          total.fetch_add(v);
          consumed.fetch_add(1);
        }
      });
  }

  for (auto &t : threads)
  {
    t.join();
  }
  REQUIRE(consumed.load() == producers * perProducer);
  REQUIRE(total.load() == producers * (perProducer * (perProducer + 1) / 2));
  REQUIRE(queue.size() == 0);
}
