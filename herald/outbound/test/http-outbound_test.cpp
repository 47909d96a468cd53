#include "herald/http-outbound.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "herald/byte-buffer.hpp"
#include "herald/charset.hpp"
#include "herald/exchange-info.hpp"
#include "herald/http-method.hpp"
#include "herald/invalid-argument.hpp"
#include "herald/outbound-config.hpp"
#include "herald/outbound-object.hpp"
#include "herald/payload-stream.hpp"
#include "herald/recording-transport.hpp"
#include "herald/send-error.hpp"
#include "herald/send-result-capture.hpp"
#include "herald/send-unit.hpp"
#include "herald/websocket-frame.hpp"

namespace herald {

namespace {

using test::RecordingTransport;
using test::SendResultCapture;

PayloadStream<ByteBuffer> Bytes(std::initializer_list<std::string_view> chunks) {
  std::vector<ByteBuffer> buffers;
  for (std::string_view chunk : chunks) {
    buffers.emplace_back(chunk);
  }
  return PayloadStream<ByteBuffer>::Of(std::move(buffers));
}

// Bytes() counting its traversals in 'nbOpens'.
PayloadStream<ByteBuffer> CountedBytes(std::initializer_list<std::string_view> chunks, std::atomic<int>& nbOpens) {
  return PayloadStream<ByteBuffer>::FromGenerator([stream = Bytes(chunks), &nbOpens]() {
    ++nbOpens;
    return stream.open();
  });
}

ExchangeInfo HttpExchange(std::string uri = "/") { return ExchangeInfo{http::Method::GET, std::move(uri), false}; }

ExchangeInfo WebsocketExchange(std::string uri = "/ws") {
  return ExchangeInfo{http::Method::GET, std::move(uri), true};
}

bool IsBodyEntry(std::string_view entry) { return entry.starts_with("bytes:") || entry.starts_with("object:"); }

// Runs 'nbThreads' threads released at the same time, each calling 'fn(threadIdx)'.
template <class Func>
void RunConcurrently(std::size_t nbThreads, Func fn) {
  std::atomic<bool> go{false};
  std::vector<std::jthread> threads;
  threads.reserve(nbThreads);
  for (std::size_t idx = 0; idx < nbThreads; ++idx) {
    threads.emplace_back([&go, &fn, idx] {
      while (!go.load(std::memory_order_acquire)) {
        std::this_thread::yield();
      }
      fn(idx);
    });
  }
  go.store(true, std::memory_order_release);
}

class HttpOutboundTest : public ::testing::Test {
 protected:
  RecordingTransport transport;
  SendResultCapture capture;
};

class HttpOutboundDeferredTest : public ::testing::Test {
 protected:
  RecordingTransport transport{RecordingTransport::Completion::Deferred};
  SendResultCapture capture;
};

}  // namespace

// ============================
// Laziness
// ============================

TEST_F(HttpOutboundTest, BuildingUnitsHasNoSideEffect) {
  HttpOutbound outbound(transport, HttpExchange());
  std::atomic<int> nbOpens{0};

  auto headers = outbound.sendHeaders();
  auto body = outbound.send(CountedBytes({"a"}, nbOpens));
  auto text = outbound.sendText(PayloadStream<std::string>::Of({"t"}));
  auto objects = outbound.sendObjects(PayloadStream<OutboundObject>::Of({OutboundObject(ByteBuffer("o"))}));

  EXPECT_FALSE(outbound.hasSentHeaders());
  EXPECT_EQ(transport.commitHeadersCalls(), 0U);
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_EQ(transport.streamObjectsCalls(), 0U);
  EXPECT_EQ(transport.allocatedBuffers(), 0U);
  EXPECT_TRUE(transport.log().empty());
  EXPECT_EQ(nbOpens.load(), 0);

  body.subscribe(capture.callback());
  EXPECT_TRUE(outbound.hasSentHeaders());
  EXPECT_EQ(nbOpens.load(), 1);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:a"}));
}

TEST_F(HttpOutboundTest, DisposedStateIsReadWhenAttaching) {
  HttpOutbound outbound(transport, HttpExchange());
  auto unit = outbound.send(Bytes({"late"}));
  transport.setDisposed();

  unit.subscribe(capture.callback());
  EXPECT_EQ(capture.errc(), SendErrc::AlreadyClosed);
  EXPECT_FALSE(outbound.hasSentHeaders());
}

TEST_F(HttpOutboundTest, EachAttachmentRunsIndependently) {
  HttpOutbound outbound(transport, HttpExchange());
  auto unit = outbound.send(Bytes({"a"}));
  unit.subscribe(capture.callback());
  unit.subscribe(capture.callback());

  EXPECT_EQ(capture.nbSignals(), 2U);
  EXPECT_EQ(capture.nbFailures(), 0U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:a", "bytes:a"}));
}

// ============================
// Header commit
// ============================

TEST_F(HttpOutboundTest, SendCommitsHeadersBeforeBody) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.send(Bytes({"hello", " world"})).subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_TRUE(outbound.hasSentHeaders());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:hello", "bytes: world"}));
}

TEST_F(HttpOutboundTest, SendHeadersIsIdempotent) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.sendHeaders().subscribe(capture.callback());
  outbound.sendHeaders().subscribe(capture.callback());
  outbound.sendHeaders().subscribe(capture.callback());

  EXPECT_EQ(capture.nbSignals(), 3U);
  EXPECT_EQ(capture.nbFailures(), 0U);
  EXPECT_EQ(transport.commitHeadersCalls(), 1U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit"}));
}

TEST_F(HttpOutboundTest, BodyAfterExplicitHeadersDoesNotCommitAgain) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.sendHeaders().subscribe(capture.callback());
  outbound.send(Bytes({"a"})).subscribe(capture.callback());
  outbound.send(Bytes({"b"})).subscribe(capture.callback());

  EXPECT_EQ(capture.nbFailures(), 0U);
  EXPECT_EQ(transport.commitHeadersCalls(), 1U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:a", "bytes:b"}));
}

TEST_F(HttpOutboundTest, EmptyPayloadStillCommitsHeaders) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.send(PayloadStream<ByteBuffer>::Empty()).subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit"}));
  EXPECT_EQ(transport.streamBytesCalls(), 1U);
}

// ============================
// At-most-one commit and ordering under concurrency
// ============================

class HttpOutboundConcurrencyTest : public ::testing::TestWithParam<std::size_t> {};

TEST_P(HttpOutboundConcurrencyTest, ConcurrentSendsCommitOnce) {
  const std::size_t nbThreads = GetParam();
  RecordingTransport transport;
  SendResultCapture capture;
  HttpOutbound outbound(transport, HttpExchange());

  RunConcurrently(nbThreads, [&](std::size_t idx) {
    const std::string chunk = "chunk-" + std::to_string(idx);
    if (idx % 2 == 0) {
      outbound.send(Bytes({chunk})).subscribe(capture.callback());
    } else {
      outbound.sendHeaders().subscribe(capture.callback());
    }
  });

  EXPECT_EQ(transport.commitHeadersCalls(), 1U);
  EXPECT_EQ(transport.commitCount(), 1U);
  EXPECT_EQ(capture.nbSignals(), nbThreads);
  EXPECT_EQ(capture.nbFailures(), 0U);
  EXPECT_TRUE(outbound.hasSentHeaders());
}

TEST_P(HttpOutboundConcurrencyTest, AwaitCommitOrdersEveryBodyAfterTheHeaders) {
  const std::size_t nbThreads = GetParam();
  RecordingTransport transport;
  SendResultCapture capture;
  HttpOutbound outbound(transport, HttpExchange(),
                        OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit).withTraceSends());

  RunConcurrently(nbThreads, [&](std::size_t idx) {
    const std::string chunk = "chunk-" + std::to_string(idx);
    outbound.send(Bytes({chunk})).subscribe(capture.callback());
  });

  const auto log = transport.log();
  ASSERT_EQ(log.size(), nbThreads + 1U);
  EXPECT_EQ(log.front(), "commit");
  for (std::size_t pos = 1; pos < log.size(); ++pos) {
    EXPECT_TRUE(IsBodyEntry(log[pos])) << log[pos];
  }
  EXPECT_EQ(transport.commitHeadersCalls(), 1U);
  EXPECT_EQ(capture.nbSignals(), nbThreads);
  EXPECT_EQ(capture.nbFailures(), 0U);
}

INSTANTIATE_TEST_SUITE_P(Threads, HttpOutboundConcurrencyTest, ::testing::Values(1U, 2U, 50U));

TEST_F(HttpOutboundDeferredTest, LoserBodyFollowsPendingCommitOnSerializedTransport) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.send(Bytes({"winner"})).subscribe(capture.callback());
  outbound.send(Bytes({"loser"})).subscribe(capture.callback());

  // the loser does not wait for the commit to complete, the transport keeps the invocation order
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:loser"}));
  EXPECT_EQ(capture.nbSignals(), 0U);

  EXPECT_EQ(transport.completePending(), 3U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:loser", "bytes:winner"}));
  EXPECT_EQ(capture.nbSignals(), 2U);
  EXPECT_EQ(capture.nbFailures(), 0U);
}

TEST_F(HttpOutboundDeferredTest, AwaitCommitLoserWaitsForCommitCompletion) {
  HttpOutbound outbound(transport, HttpExchange(), OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit));
  outbound.send(Bytes({"winner"})).subscribe(capture.callback());
  outbound.send(Bytes({"loser"})).subscribe(capture.callback());
  outbound.sendHeaders().subscribe(capture.callback());

  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit"}));
  EXPECT_EQ(transport.streamBytesCalls(), 0U);

  ASSERT_TRUE(transport.completeNext());
  // the explicit header send completes with the commit
  EXPECT_EQ(capture.nbSignals(), 1U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:loser", "bytes:winner"}));

  transport.completePending();
  EXPECT_EQ(capture.nbSignals(), 3U);
  EXPECT_EQ(capture.nbFailures(), 0U);
}

// ============================
// Disposal
// ============================

TEST_F(HttpOutboundTest, DisposedShortCircuitsEverySend) {
  HttpOutbound outbound(transport, HttpExchange());
  transport.setDisposed();
  EXPECT_TRUE(outbound.isDisposed());
  std::atomic<int> nbOpens{0};

  outbound.sendHeaders().subscribe(capture.callback());
  outbound.send(CountedBytes({"a"}, nbOpens)).subscribe(capture.callback());
  outbound.sendText(PayloadStream<std::string>::Of({"t"})).subscribe(capture.callback());
  outbound.sendObjects(PayloadStream<OutboundObject>::Of({OutboundObject(ByteBuffer("o"))}))
      .subscribe(capture.callback());

  EXPECT_EQ(capture.nbFailures(), 4U);
  EXPECT_EQ(capture.errc(), SendErrc::AlreadyClosed);
  EXPECT_EQ(capture.last()->error().message(), "This outbound is not active anymore");
  EXPECT_FALSE(outbound.hasSentHeaders());
  EXPECT_EQ(transport.commitHeadersCalls(), 0U);
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_EQ(transport.streamObjectsCalls(), 0U);
  EXPECT_EQ(nbOpens.load(), 0);
}

TEST_F(HttpOutboundTest, DisposedAfterHeadersAddsNoWrite) {
  HttpOutbound outbound(transport, HttpExchange());
  outbound.send(Bytes({"a"})).subscribe(capture.callback());
  transport.setDisposed();

  outbound.send(Bytes({"b"})).subscribe(capture.callback());
  outbound.sendHeaders().subscribe(capture.callback());

  EXPECT_EQ(capture.nbFailures(), 2U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:a"}));
  EXPECT_EQ(transport.streamBytesCalls(), 1U);
}

// ============================
// Failures
// ============================

TEST_F(HttpOutboundTest, HeaderFailureBlocksBody) {
  HttpOutbound outbound(transport, HttpExchange());
  transport.failCommits("connection reset");
  std::atomic<int> nbOpens{0};

  outbound.send(CountedBytes({"body"}, nbOpens)).subscribe(capture.callback());

  ASSERT_EQ(capture.errc(), SendErrc::HeaderCommitFailure);
  EXPECT_EQ(capture.last()->error().message(), "connection reset");
  EXPECT_EQ(nbOpens.load(), 0);
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_TRUE(transport.log().empty());
  // no rollback of the gate
  EXPECT_TRUE(outbound.hasSentHeaders());
}

TEST_F(HttpOutboundTest, HeaderCommitThatThrowsIsReportedAsFailure) {
  HttpOutbound outbound(transport, HttpExchange());
  transport.throwOnCommit();

  outbound.send(Bytes({"body"})).subscribe(capture.callback());

  ASSERT_EQ(capture.errc(), SendErrc::HeaderCommitFailure);
  EXPECT_EQ(capture.last()->error().message(), "transport refused the header commit");
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
}

TEST_F(HttpOutboundDeferredTest, AwaitCommitFailurePropagatesToLosers) {
  HttpOutbound outbound(transport, HttpExchange(), OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit));
  SendResultCapture winner;
  outbound.send(Bytes({"winner"})).subscribe(winner.callback());
  outbound.send(Bytes({"loser"})).subscribe(capture.callback());

  ASSERT_TRUE(transport.failNext(SendError(SendErrc::HeaderCommitFailure, "broken pipe")));
  EXPECT_EQ(winner.errc(), SendErrc::HeaderCommitFailure);
  EXPECT_EQ(capture.errc(), SendErrc::HeaderCommitFailure);
  EXPECT_EQ(capture.last()->error().message(), "broken pipe");

  // later attempts observe the same outcome
  outbound.send(Bytes({"late"})).subscribe(capture.callback());
  EXPECT_EQ(capture.nbFailures(), 2U);
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit"}));
}

TEST_F(HttpOutboundTest, BodyFailureKeepsHeadersSent) {
  HttpOutbound outbound(transport, HttpExchange());
  transport.failBodies("peer closed", 1);

  outbound.send(Bytes({"first", "second"})).subscribe(capture.callback());

  ASSERT_EQ(capture.errc(), SendErrc::BodyStreamFailure);
  EXPECT_EQ(capture.last()->error().message(), "peer closed");
  EXPECT_TRUE(outbound.hasSentHeaders());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:first"}));
}

// ============================
// Cancellation
// ============================

TEST_F(HttpOutboundDeferredTest, CancelDuringCommitSkipsBody) {
  HttpOutbound outbound(transport, HttpExchange());
  std::atomic<int> nbOpens{0};
  auto subscription = outbound.send(CountedBytes({"body"}, nbOpens)).subscribe(capture.callback());
  subscription.cancel();

  transport.completePending();
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_EQ(nbOpens.load(), 0);
  EXPECT_EQ(capture.nbSignals(), 0U);
  EXPECT_TRUE(outbound.hasSentHeaders());
}

TEST_F(HttpOutboundDeferredTest, AwaitCommitWinnerCancellationDoesNotStrandLosers) {
  HttpOutbound outbound(transport, HttpExchange(), OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit));
  SendResultCapture winner;
  auto subscription = outbound.send(Bytes({"winner"})).subscribe(winner.callback());
  outbound.send(Bytes({"loser"})).subscribe(capture.callback());
  subscription.cancel();

  transport.completePending();
  EXPECT_EQ(winner.nbSignals(), 0U);
  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:loser"}));
}

// ============================
// Text and object routing
// ============================

TEST_F(HttpOutboundTest, TextOnWebsocketUsesObjectPathOnly) {
  HttpOutbound outbound(transport, WebsocketExchange());
  EXPECT_TRUE(outbound.isWebsocketUpgrade());
  outbound.sendText(PayloadStream<std::string>::Of({"hi", "there"})).subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.streamBytesCalls(), 0U);
  EXPECT_EQ(transport.streamObjectsCalls(), 1U);
  EXPECT_EQ(transport.allocatedBuffers(), 0U);
  EXPECT_EQ(transport.log(),
            (std::vector<std::string>{"commit", "object:text-frame:hi", "object:text-frame:there"}));
}

TEST_F(HttpOutboundTest, TextOnHttpProducesOneBufferPerChunk) {
  HttpOutbound outbound(transport, HttpExchange(), OutboundConfig{}.withTextBufferExtraCapacity(8));
  outbound.sendText(PayloadStream<std::string>::Of({"caf\xC3\xA9", "", "x"}), Charset::iso8859_1)
      .subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.streamObjectsCalls(), 0U);
  EXPECT_EQ(transport.streamBytesCalls(), 1U);
  EXPECT_EQ(transport.allocatedBuffers(), 3U);
  EXPECT_EQ(transport.lastAllocatedCapacity(), 1U + 8U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:caf\xE9", "bytes:", "bytes:x"}));
}

TEST_F(HttpOutboundTest, TextUsesConfiguredCharset) {
  HttpOutbound outbound(transport, HttpExchange(), OutboundConfig{}.withCharset(Charset::utf16le));
  outbound.sendText(PayloadStream<std::string>::Of({"A"})).subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", std::string("bytes:A\0", 8)}));
}

TEST_F(HttpOutboundTest, ObjectsAreForwardedAsIs) {
  HttpOutbound outbound(transport, WebsocketExchange());
  std::vector<OutboundObject> objects;
  objects.emplace_back(ByteBuffer("raw"));
  objects.emplace_back(std::in_place_type<websocket::BinaryFrame>, ByteBuffer("bin"));
  objects.emplace_back(std::in_place_type<websocket::TextFrame>, "txt");
  outbound.sendObjects(PayloadStream<OutboundObject>::Of(std::move(objects))).subscribe(capture.callback());

  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.streamObjectsCalls(), 1U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "object:bytes:raw", "object:binary-frame:bin",
                                                        "object:text-frame:txt"}));
}

// ============================
// Exchange replacement
// ============================

TEST_F(HttpOutboundTest, ReplacementInheritsSentHeaders) {
  HttpOutbound upgrade(transport, HttpExchange("/chat"));
  upgrade.sendHeaders().subscribe(capture.callback());

  HttpOutbound websocket(transport, upgrade, WebsocketExchange("/chat"));
  EXPECT_TRUE(websocket.hasSentHeaders());
  websocket.sendText(PayloadStream<std::string>::Of({"ping"})).subscribe(capture.callback());
  websocket.sendHeaders().subscribe(capture.callback());

  EXPECT_EQ(capture.nbFailures(), 0U);
  EXPECT_EQ(transport.commitHeadersCalls(), 1U);
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "object:text-frame:ping"}));
}

TEST_F(HttpOutboundTest, ReplacementOfUnsentExchangeCommits) {
  HttpOutbound first(transport, HttpExchange(),
                     OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit).withCharset(Charset::usascii));
  HttpOutbound second(transport, first, HttpExchange("/next"));
  EXPECT_FALSE(second.hasSentHeaders());
  EXPECT_EQ(second.config(), first.config());

  second.send(Bytes({"a"})).subscribe(capture.callback());
  EXPECT_TRUE(capture.succeeded());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:a"}));
  EXPECT_FALSE(first.hasSentHeaders());
}

TEST_F(HttpOutboundDeferredTest, AwaitCommitReplacementDoesNotWait) {
  const auto config = OutboundConfig{}.withHeaderOrdering(HeaderOrdering::AwaitCommit);
  HttpOutbound first(transport, HttpExchange(), config);
  first.sendHeaders().subscribe(capture.callback());
  transport.completePending();

  HttpOutbound second(transport, first, WebsocketExchange());
  second.send(Bytes({"frame"})).subscribe(capture.callback());
  EXPECT_EQ(transport.log(), (std::vector<std::string>{"commit", "bytes:frame"}));
}

// ============================
// Accessors
// ============================

TEST_F(HttpOutboundTest, ToString) {
  EXPECT_EQ(HttpOutbound(transport, HttpExchange("/index.html")).toString(), "GET:/index.html");
  EXPECT_EQ(HttpOutbound(transport, ExchangeInfo{http::Method::POST, "/upload", false}).toString(), "POST:/upload");
  EXPECT_EQ(HttpOutbound(transport, WebsocketExchange("/chat")).toString(), "ws:/chat");
}

TEST_F(HttpOutboundTest, InfoAndConfig) {
  HttpOutbound outbound(transport, ExchangeInfo{http::Method::PUT, "/r", false},
                        OutboundConfig{}.withCharset(Charset::utf16be));
  EXPECT_EQ(outbound.info().method, http::Method::PUT);
  EXPECT_EQ(outbound.info().uri, "/r");
  EXPECT_EQ(outbound.config().charset, Charset::utf16be);
  EXPECT_FALSE(outbound.isDisposed());
}

TEST_F(HttpOutboundTest, InvalidConfigIsRejected) {
  const auto config = OutboundConfig{}.withTextBufferExtraCapacity(OutboundConfig::kMaxTextBufferExtraCapacity + 1);
  EXPECT_THROW(HttpOutbound outbound(transport, HttpExchange(), config), invalid_argument);
}

TEST(SendKind, Names) {
  EXPECT_EQ(SendKindName(SendKind::HeadersOnly), "headers-only");
  EXPECT_EQ(SendKindName(SendKind::Body), "body");
  EXPECT_EQ(SendKindName(SendKind::ObjectStream), "object-stream");
  EXPECT_EQ(SendKindName(SendKind::TextStream), "text-stream");
}

}  // namespace herald
