#include "internal/transfer/receipt_table.hpp"
#include "internal/transfer/window_queue.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

namespace {

using vault::transfer::PartJob;
using vault::transfer::ReceiptTable;
using vault::transfer::WindowQueue;

void TestOutOfOrderReceiptsComeBackOrdered() {
  ReceiptTable table(3);
  table.Record(3, "etag-3");
  table.Record(1, "etag-1");
  assert(!table.Complete());
  assert((table.Missing() == std::vector<uint32_t>{2}));

  table.Record(2, "etag-2");
  assert(table.Complete());

  const auto ordered = table.Ordered();
  assert(ordered.size() == 3);
  for (uint32_t i = 0; i < 3; ++i) {
    assert(ordered[i].part_number() == i + 1);
    assert(ordered[i].receipt_token() == "etag-" + std::to_string(i + 1));
  }
  assert(table.Get(2) == std::optional<std::string>("etag-2"));
}

void TestSecondReceiptForPartIsRejected() {
  ReceiptTable table(2);
  table.Record(1, "a");

  bool thrown = false;
  try {
    table.Record(1, "b");
  } catch (const vault::util::InvalidState&) {
    thrown = true;
  }
  assert(thrown);
  assert(*table.Get(1) == "a");
}

void TestOutOfRangeAndEmptyReceiptsAreRejected() {
  ReceiptTable table(2);
  for (uint32_t bad : {0u, 3u}) {
    bool thrown = false;
    try {
      table.Record(bad, "x");
    } catch (const vault::util::InvalidArgument&) {
      thrown = true;
    }
    assert(thrown);
  }

  bool thrown = false;
  try {
    table.Record(1, "");
  } catch (const vault::util::InvalidArgument&) {
    thrown = true;
  }
  assert(thrown);
  assert(table.Size() == 0);
}

void TestConcurrentWorkersFillEverySlot() {
  constexpr uint32_t kParts = 400;
  ReceiptTable       table(kParts);
  WindowQueue        queue(4);

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      while (auto job = queue.Dequeue()) {
        table.Record(job->window.part_number, "etag-" + std::to_string(job->window.part_number));
      }
    });
  }
  for (uint32_t n = 1; n <= kParts; ++n) {
    PartJob job;
    job.window.part_number = n;
    assert(queue.Enqueue(std::move(job)));
  }
  queue.Close();
  for (auto& worker : workers) worker.join();

  assert(table.Complete());
  assert(table.Missing().empty());
  assert(!queue.Enqueue(PartJob{}));
}

void TestShutdownWakesBlockedConsumers() {
  WindowQueue queue(1);
  std::thread consumer([&] { assert(!queue.Dequeue().has_value()); });
  queue.Shutdown();
  consumer.join();
}

} // namespace

int main() {
  TestOutOfOrderReceiptsComeBackOrdered();
  TestSecondReceiptForPartIsRejected();
  TestOutOfRangeAndEmptyReceiptsAreRejected();
  TestConcurrentWorkersFillEverySlot();
  TestShutdownWakesBlockedConsumers();

  std::cout << "vault_unit_receipt_table: pass\n";
  return 0;
}
