#include "integra/WorkQueue.h"

#include <atomic>
#include <numeric>
#include <thread>
#include <vector>

#include "integra/Logging.h"

namespace {

void
TestDrainAfterClose() {
  integra::WorkQueue<int> queue(4);
  for (int i = 0; i < 4; ++i) {
    INTEGRA_LOG_ASSERT(queue.Push(i));
  }
  queue.Close();
  INTEGRA_LOG_ASSERT(!queue.Push(4));

  for (int i = 0; i < 4; ++i) {
    auto item = queue.Pop();
    INTEGRA_LOG_ASSERT(item && *item == i);
  }
  INTEGRA_LOG_ASSERT(!queue.Pop());
}

void
TestCancelDrops() {
  integra::WorkQueue<int> queue(4);
  INTEGRA_LOG_ASSERT(queue.Push(1));
  INTEGRA_LOG_ASSERT(queue.Push(2));
  queue.Cancel();
  INTEGRA_LOG_ASSERT(queue.size() == 0);
  INTEGRA_LOG_ASSERT(!queue.Pop());
  INTEGRA_LOG_ASSERT(!queue.Push(3));
}

void
TestBoundedProducerConsumer() {
  constexpr int kItems = 1000;
  integra::WorkQueue<int> queue(2);
  std::atomic<int> sum{0};
  std::atomic<int> count{0};

  std::vector<std::thread> consumers;
  for (int i = 0; i < 4; ++i) {
    consumers.emplace_back([&] {
      while (auto item = queue.Pop()) {
        INTEGRA_LOG_ASSERT(queue.size() <= 2);
        sum += *item;
        ++count;
      }
    });
  }

  for (int i = 0; i < kItems; ++i) {
    INTEGRA_LOG_ASSERT(queue.Push(i));
  }
  queue.Close();
  for (std::thread& t : consumers) {
    t.join();
  }

  INTEGRA_LOG_ASSERT(count == kItems);
  INTEGRA_LOG_ASSERT(sum == kItems * (kItems - 1) / 2);
}

void
TestCancelUnblocksProducer() {
  integra::WorkQueue<int> queue(1);
  INTEGRA_LOG_ASSERT(queue.Push(0));

  std::thread producer([&] {
    // Blocks until the queue is cancelled
    INTEGRA_LOG_ASSERT(!queue.Push(1));
  });
  queue.Cancel();
  producer.join();
}

void
TestFirstErrorSlot() {
  integra::FirstErrorSlot<int> slot;
  INTEGRA_LOG_ASSERT(!slot.HasValue());
  INTEGRA_LOG_ASSERT(!slot.value());

  std::atomic<int> winners{0};
  std::vector<std::thread> threads;
  for (int i = 1; i <= 8; ++i) {
    threads.emplace_back([&, i] {
      if (slot.Offer(i)) {
        ++winners;
      }
    });
  }
  for (std::thread& t : threads) {
    t.join();
  }

  INTEGRA_LOG_ASSERT(winners == 1);
  INTEGRA_LOG_ASSERT(slot.HasValue());
  int first = *slot.value();
  INTEGRA_LOG_ASSERT(!slot.Offer(100));
  INTEGRA_LOG_ASSERT(*slot.value() == first);
}

}  // namespace

int
main() {
  TestDrainAfterClose();
  TestCancelDrops();
  TestBoundedProducerConsumer();
  TestCancelUnblocksProducer();
  TestFirstErrorSlot();
}
