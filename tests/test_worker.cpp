/**
 * @file test_worker.cpp
 * @brief Tests for worker.hpp: the worker main loop, driven in-process over
 *        a real ChannelPair.
 */

#include "pmap/worker.hpp"
#include "pmap/process.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace {

struct Record {
  pmap::RecordKind kind;
  uint64_t index;
  int value;
  std::string error;
  std::string trace;
};

/// Queue one work batch of (index, value) pairs and close the input.
void FeedBatch(pmap::ChannelPair& ch, const std::vector<std::pair<uint64_t, int>>& items) {
  std::vector<uint8_t> payload;
  pmap::ByteWriter w(payload);
  for (const auto& it : items) {
    w.PutU64(it.first);
    pmap::Serializer<int>::Encode(it.second, w);
  }
  REQUIRE(pmap::SendFrame(ch.InputWriteFd(), pmap::FrameType::kWorkBatch,
                          static_cast<uint32_t>(items.size()), payload) ==
          pmap::ChannelStatus::kOk);
}

/// Decode every record readable from @p fd until EOF.
void DecodeRecords(int fd, std::vector<Record>& records) {
  pmap::Frame frame;
  while (pmap::RecvFrame(fd, frame) == pmap::ChannelStatus::kOk) {
    REQUIRE(frame.type == pmap::FrameType::kResultBatch);
    pmap::ByteReader r(frame.payload.data(), frame.payload.size());
    for (uint32_t k = 0; k < frame.count; ++k) {
      Record rec{pmap::RecordKind::kDone, 0, 0, "", ""};
      REQUIRE(pmap::detail::GetRecordHead(r, rec.kind, rec.index));
      if (rec.kind == pmap::RecordKind::kValue) {
        REQUIRE(r.GetPod(rec.value));
      } else if (rec.kind == pmap::RecordKind::kError) {
        pmap::ErrorEnvelope env;
        REQUIRE(pmap::Serializer<pmap::ErrorEnvelope>::Decode(r, env));
        REQUIRE(env.origin_worker == 5U);
        rec.error = env.Summary();
        rec.trace = env.formatted_trace;
      }
      records.push_back(rec);
    }
    REQUIRE(r.AtEnd());
  }
}

/// Run @p worker to completion and decode everything it sent.
int RunAndCollect(const pmap::Worker<int, int>& worker, pmap::ChannelPair& ch,
                  std::vector<Record>& records) {
  ch.CloseInput();
  int out_fd = ::dup(ch.OutputReadFd());
  REQUIRE(out_fd >= 0);

  int code = pmap::RunWorker(worker, ch, 5);

  DecodeRecords(out_fd, records);
  ::close(out_fd);
  return code;
}

}  // namespace

// ============================================================================
// Normal operation
// ============================================================================

TEST_CASE("MapWorker emits one value and one done per input", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  FeedBatch(pair.value(), {{10, 1}, {11, 2}, {12, 3}});

  auto worker = pmap::MapWorker<int, int>([](const int& x) { return x * 2; });
  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == 0);

  REQUIRE(recs.size() == 7U);
  REQUIRE(recs[0].kind == pmap::RecordKind::kValue);
  REQUIRE(recs[0].index == 10U);
  REQUIRE(recs[0].value == 2);
  REQUIRE(recs[1].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[1].index == 10U);
  REQUIRE(recs[4].value == 6);
  REQUIRE(recs[5].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[5].index == 12U);
  REQUIRE(recs[6].kind == pmap::RecordKind::kExit);
}

TEST_CASE("Generator body may emit zero or many values per input", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  FeedBatch(pair.value(), {{0, 2}, {1, 0}, {2, 1}});

  // Emits x copies of x.
  auto worker = pmap::MakeWorker<int, int>(
      [](pmap::InputStream<int>& in, pmap::Emitter<int>& out) {
        int x = 0;
        while (in.Next(x)) {
          for (int i = 0; i < x; ++i) out.Emit(x);
        }
      },
      "repeat");
  REQUIRE(worker.Name() == "repeat");

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == 0);

  std::vector<std::pair<pmap::RecordKind, uint64_t>> seen;
  for (const auto& r : recs) seen.emplace_back(r.kind, r.index);
  using K = pmap::RecordKind;
  std::vector<std::pair<K, uint64_t>> expected = {
      {K::kValue, 0}, {K::kValue, 0}, {K::kDone, 0}, {K::kDone, 1},
      {K::kValue, 2}, {K::kDone, 2},  {K::kExit, 0}};
  REQUIRE(seen == expected);
}

TEST_CASE("CurrentIndex follows the pulled input", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  FeedBatch(pair.value(), {{7, 0}, {8, 0}});

  auto worker = pmap::MakeWorker<int, int>(
      [](pmap::InputStream<int>& in, pmap::Emitter<int>& out) {
        int x = 0;
        while (in.Next(x)) out.Emit(static_cast<int>(in.CurrentIndex()));
      });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == 0);
  REQUIRE(recs[0].value == 7);
  REQUIRE(recs[2].value == 8);
}

TEST_CASE("Body that stops early still says goodbye", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  FeedBatch(pair.value(), {{0, 1}, {1, 2}, {2, 3}});

  auto worker = pmap::MakeWorker<int, int>(
      [](pmap::InputStream<int>& in, pmap::Emitter<int>& out) {
        int x = 0;
        if (in.Next(x)) out.Emit(x);
      });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == 0);
  REQUIRE(recs.size() == 3U);
  REQUIRE(recs[1].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[2].kind == pmap::RecordKind::kExit);
}

TEST_CASE("Value emitted before any input is dropped", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());

  auto worker = pmap::MakeWorker<int, int>(
      [](pmap::InputStream<int>& in, pmap::Emitter<int>& out) {
        out.Emit(99);
        int x = 0;
        while (in.Next(x)) {
        }
      });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == 0);
  REQUIRE(recs.size() == 1U);
  REQUIRE(recs[0].kind == pmap::RecordKind::kExit);
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("Exception becomes an error record for the failing input", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  FeedBatch(pair.value(), {{0, 0}, {1, 3}, {2, 0}});

  auto worker = pmap::MapWorker<int, int>([](const int& x) {
    if (x == 3) throw std::invalid_argument("Bad value: " + std::to_string(x));
    return x;
  });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == pmap::kWorkerFailedExitCode);

  REQUIRE(recs.size() == 3U);
  REQUIRE(recs[0].kind == pmap::RecordKind::kValue);
  REQUIRE(recs[1].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[2].kind == pmap::RecordKind::kError);
  REQUIRE(recs[2].index == 1U);
  REQUIRE(recs[2].error == "std::invalid_argument: Bad value: 3");
}

TEST_CASE("Exception before the first input carries kNoIndex", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());

  auto worker = pmap::MakeWorker<int, int>(
      [](pmap::InputStream<int>&, pmap::Emitter<int>&) { throw std::runtime_error("setup"); });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == pmap::kWorkerFailedExitCode);
  REQUIRE(recs.size() == 1U);
  REQUIRE(recs[0].index == pmap::kNoIndex);
}

TEST_CASE("Malformed work batch ends the worker with the channel code", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  uint8_t junk[pmap::kFrameHeaderSize] = {0};
  REQUIRE(::write(pair.value().InputWriteFd(), junk, sizeof(junk)) ==
          static_cast<ssize_t>(sizeof(junk)));

  int pulled = 0;
  auto worker = pmap::MakeWorker<int, int>(
      [&pulled](pmap::InputStream<int>& in, pmap::Emitter<int>&) {
        int x = 0;
        while (in.Next(x)) ++pulled;
      });

  std::vector<Record> recs;
  REQUIRE(RunAndCollect(worker, pair.value(), recs) == pmap::kWorkerChannelExitCode);
  REQUIRE(pulled == 0);
  REQUIRE(recs.empty());
}

TEST_CASE("RunWorker closes the worker side", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  pair.value().CloseInput();
  auto worker = pmap::MapWorker<int, int>([](const int& x) { return x; });
  REQUIRE(pmap::RunWorker(worker, pair.value(), 0) == 0);
  REQUIRE(pair.value().OpenDescriptors().empty());
}

// ============================================================================
// Worker process entry
// ============================================================================

TEST_CASE("RunWorkerProcess reports an uncaught exception and exits", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  pmap::ChannelPair& ch = pair.value();
  FeedBatch(ch, {{0, 4}, {1, -1}, {2, 6}});
  ch.CloseInput();

  auto worker = pmap::MapWorker<int, int>([](const int& x) {
    if (x < 0) throw std::out_of_range("below zero");
    return x;
  });
  auto proc = pmap::WorkerProcess::Spawn([&worker, &ch]() noexcept {
    ch.CloseCoordinatorSide();
    return pmap::RunWorkerProcess(worker, ch, 5);
  });
  REQUIRE(proc.has_value());
  ch.CloseWorkerSide();

  std::vector<Record> recs;
  DecodeRecords(ch.OutputReadFd(), recs);
  pmap::WaitResult wr = proc.value().Wait(5000);
  REQUIRE(wr.exited);
  REQUIRE(wr.exit_code == pmap::kWorkerFailedExitCode);

  REQUIRE(recs.size() == 3U);
  REQUIRE(recs[0].kind == pmap::RecordKind::kValue);
  REQUIRE(recs[0].value == 4);
  REQUIRE(recs[1].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[2].kind == pmap::RecordKind::kError);
  REQUIRE(recs[2].index == 1U);
  REQUIRE(recs[2].error == "std::out_of_range: below zero");
  REQUIRE(recs[2].trace.find("RunBodyCatching") == std::string::npos);
}

TEST_CASE("RunWorkerProcess returns normally when the body completes", "[worker]") {
  auto pair = pmap::ChannelPair::Open();
  REQUIRE(pair.has_value());
  pmap::ChannelPair& ch = pair.value();
  FeedBatch(ch, {{0, 7}});
  ch.CloseInput();

  auto worker = pmap::MapWorker<int, int>([](const int& x) { return x + 1; });
  auto proc = pmap::WorkerProcess::Spawn([&worker, &ch]() noexcept {
    ch.CloseCoordinatorSide();
    return pmap::RunWorkerProcess(worker, ch, 5);
  });
  REQUIRE(proc.has_value());
  ch.CloseWorkerSide();

  std::vector<Record> recs;
  DecodeRecords(ch.OutputReadFd(), recs);
  REQUIRE(proc.value().Wait(5000).Clean());
  REQUIRE(recs.size() == 3U);
  REQUIRE(recs[0].value == 8);
  REQUIRE(recs[1].kind == pmap::RecordKind::kDone);
  REQUIRE(recs[2].kind == pmap::RecordKind::kExit);
}
