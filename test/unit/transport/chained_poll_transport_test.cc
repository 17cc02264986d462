/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "signalink/transport/http_stream/chained_poll_transport.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "test/mocks/fake_http_request.hpp"
#include "test/mocks/fake_timer.hpp"

using namespace signalink;
using namespace signalink::transport;
using namespace signalink::test;
using namespace std::chrono_literals;
using interface::ChannelEvent;
using interface::SocketEvent;
using nlohmann::json;

class ChainedPollTransportTest : public ::testing::Test {
 protected:
  void SetUp() override {
    cfg_.host = "localhost";
    cfg_.port = 9000;
    cfg_.path = "/";
    cfg_.key = "peerjs";
    transport_ = std::make_unique<ChainedPollTransport>(cfg_, backend_.factory(), scheduler_.factory());
    transport_->on_event([this](const ChannelEvent& event) { events_.push_back(event); });
  }

  std::vector<json> messages() const {
    std::vector<json> result;
    for (const auto& event : events_) {
      if (event.type == SocketEvent::Message) result.push_back(event.message);
    }
    return result;
  }

  size_t count(SocketEvent type) const {
    size_t n = 0;
    for (const auto& event : events_) {
      if (event.type == type) ++n;
    }
    return n;
  }

  FakeTimerScheduler scheduler_;
  FakeHttpBackend backend_;
  config::ServerConnectionConfig cfg_;
  std::unique_ptr<ChainedPollTransport> transport_;
  std::vector<ChannelEvent> events_;
};

TEST_F(ChainedPollTransportTest, StartOpensFirstPoll) {
  EXPECT_TRUE(transport_->is_disconnected());
  EXPECT_EQ(transport_->base_url(), "http://localhost:9000/peerjs");

  transport_->start("abc", "tkn");

  EXPECT_FALSE(transport_->is_disconnected());
  ASSERT_EQ(backend_.polls().size(), 1u);
  EXPECT_EQ(backend_.poll(0)->url, "http://localhost:9000/peerjs/abc/tkn/id?i=0");
}

TEST_F(ChainedPollTransportTest, SecureConfigUsesHttps) {
  cfg_.secure = true;
  ChainedPollTransport secure(cfg_, backend_.factory(), scheduler_.factory());
  EXPECT_EQ(secure.base_url(), "https://localhost:9000/peerjs");
}

TEST_F(ChainedPollTransportTest, SecondStartIsIgnored) {
  transport_->start("abc", "tkn");
  transport_->start("other", "tkn");

  EXPECT_EQ(backend_.polls().size(), 1u);
}

TEST_F(ChainedPollTransportTest, SendBeforeStartIsDropped) {
  transport_->send({{"type", "OFFER"}});

  EXPECT_TRUE(transport_->queued_messages().empty());
  EXPECT_TRUE(backend_.posts().empty());
}

TEST_F(ChainedPollTransportTest, SendWithoutIdIsQueuedAndNeverFlushed) {
  transport_->start("", "tkn");
  transport_->send({{"type", "OFFER"}, {"n", 1}});
  transport_->send({{"n", 2}});

  ASSERT_EQ(transport_->queued_messages().size(), 2u);
  EXPECT_EQ(transport_->queued_messages()[0]["n"], 1);
  EXPECT_EQ(transport_->queued_messages()[1]["n"], 2);

  backend_.poll(0)->receive("{\"type\":\"OPEN\"}\n");
  scheduler_.advance(30s);

  EXPECT_EQ(transport_->queued_messages().size(), 2u);
  EXPECT_TRUE(backend_.posts().empty());
  EXPECT_EQ(count(SocketEvent::Error), 0u);
}

TEST_F(ChainedPollTransportTest, SendPostsToLowercasedTypeEndpoint) {
  transport_->start("abc", "tkn");
  const json offer = {{"type", "OFFER"}, {"payload", {{"sdp", "v=0"}}}, {"dst", "peer"}};

  transport_->send(offer);

  ASSERT_EQ(backend_.posts().size(), 1u);
  auto post = backend_.posts()[0];
  EXPECT_EQ(post->method, "POST");
  EXPECT_EQ(post->url, "http://localhost:9000/peerjs/abc/tkn/offer");
  EXPECT_EQ(post->headers["Content-Type"], "application/json");
  EXPECT_EQ(json::parse(post->body), offer);
}

TEST_F(ChainedPollTransportTest, SendWithoutTypeEmitsInvalidMessage) {
  transport_->start("abc", "tkn");

  transport_->send({{"payload", {{"sdp", "v=0"}}}});

  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0].type, SocketEvent::Error);
  EXPECT_EQ(events_[0].error, "Invalid message");
  EXPECT_TRUE(backend_.posts().empty());
}

TEST_F(ChainedPollTransportTest, PartialLineIsCompletedByNextSnapshot) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  poll->receive("{\"a\":1}\n{\"b\":2");
  ASSERT_EQ(messages().size(), 1u);
  EXPECT_EQ(messages()[0], json({{"a", 1}}));

  poll->receive("}\n");
  ASSERT_EQ(messages().size(), 2u);
  EXPECT_EQ(messages()[1], json({{"b", 2}}));
  EXPECT_FALSE(transport_->current_request()->has_buffered_indices());
}

TEST_F(ChainedPollTransportTest, GrowingSnapshotsEmitEveryMessageOnceInOrder) {
  std::vector<json> expected;
  std::string stream;
  for (int i = 0; i < 12; ++i) {
    json message = {{"type", "CANDIDATE"}, {"seq", i}, {"payload", {{"text", std::string(static_cast<size_t>(i), 'x')}}}};
    expected.push_back(message);
    stream += message.dump() + "\n";
  }

  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  // Deliver with varying chunk sizes, including single bytes
  size_t offset = 0;
  size_t step = 1;
  while (offset < stream.size()) {
    const size_t size = std::min(step, stream.size() - offset);
    poll->receive(stream.substr(offset, size));
    offset += size;
    step = step % 17 + 1;
  }

  EXPECT_EQ(messages(), expected);
}

TEST_F(ChainedPollTransportTest, TrailingNewlineNeverBuffersEmptyLine) {
  transport_->start("abc", "tkn");
  backend_.poll(0)->receive("{\"a\":1}\n");

  EXPECT_EQ(messages().size(), 1u);
  EXPECT_FALSE(transport_->current_request()->has_buffered_indices());
  EXPECT_EQ(transport_->current_request()->index(), 1u);
}

TEST_F(ChainedPollTransportTest, UnterminatedLastLineIsBuffered) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  poll->receive("{\"a\":1}");
  EXPECT_TRUE(messages().empty());
  ASSERT_TRUE(transport_->current_request()->has_buffered_indices());
  EXPECT_EQ(transport_->current_request()->buffered_indices().front(), 0u);

  poll->receive("\n");
  ASSERT_EQ(messages().size(), 1u);
  EXPECT_EQ(messages()[0], json({{"a", 1}}));
}

TEST_F(ChainedPollTransportTest, MalformedCompleteLineIsDropped) {
  transport_->start("abc", "tkn");
  backend_.poll(0)->receive("not json\n{\"a\":1}\n");

  ASSERT_EQ(messages().size(), 1u);
  EXPECT_EQ(messages()[0], json({{"a", 1}}));
  EXPECT_EQ(count(SocketEvent::Error), 0u);
}

TEST_F(ChainedPollTransportTest, UnparseableBufferedLineHoldsBackLaterLines) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  poll->receive("{\"a\":");
  poll->receive("1");  // still incomplete, stays at the buffer front
  EXPECT_TRUE(messages().empty());

  poll->receive("}\n{\"b\":2}\n");
  ASSERT_EQ(messages().size(), 2u);
  EXPECT_EQ(messages()[0], json({{"a", 1}}));
  EXPECT_EQ(messages()[1], json({{"b", 2}}));
}

TEST_F(ChainedPollTransportTest, TerminatedMalformedBufferedLineIsDropped) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  // Given: a tail that will never become valid JSON
  poll->receive("{\"a\":1}\n{bad");
  ASSERT_EQ(messages().size(), 1u);

  // When: its newline arrives together with more lines
  poll->receive("\n{\"c\":3}\n{\"d\":4}\n");
  poll->finish();

  // Then: the bad line is dropped and delivery continues in order
  ASSERT_EQ(messages().size(), 3u);
  EXPECT_EQ(messages()[0], json({{"a", 1}}));
  EXPECT_EQ(messages()[1], json({{"c", 3}}));
  EXPECT_EQ(messages()[2], json({{"d", 4}}));
}

TEST_F(ChainedPollTransportTest, IncompleteBufferedTailDoesNotBlockLaterSnapshots) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  poll->receive("{\"a\":1}\n{\"b\":");
  poll->receive("[1,");
  EXPECT_EQ(messages().size(), 1u);

  poll->receive("2]}\n{\"c\":3}\n");
  ASSERT_EQ(messages().size(), 3u);
  EXPECT_EQ(messages()[1], json::parse(R"({"b":[1,2]})"));
  EXPECT_EQ(messages()[2], json({{"c", 3}}));
}

TEST_F(ChainedPollTransportTest, CompletedResponseFlushesUnterminatedLine) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);

  poll->receive("{\"a\":1}\n{\"b\":2}");
  EXPECT_EQ(messages().size(), 1u);

  poll->finish();
  ASSERT_EQ(messages().size(), 2u);
  EXPECT_EQ(messages()[1], json({{"b", 2}}));
}

TEST_F(ChainedPollTransportTest, IdleTimeoutChainsNextPoll) {
  transport_->start("abc", "tkn");
  backend_.poll(0)->receive("{\"n\":1}\n");

  scheduler_.advance(25s);

  ASSERT_EQ(backend_.polls().size(), 2u);
  EXPECT_EQ(backend_.poll(1)->url, "http://localhost:9000/peerjs/abc/tkn/id?i=1");
  EXPECT_EQ(transport_->current_request()->stream_index(), 1u);
  ASSERT_NE(transport_->current_request()->previous_request(), nullptr);

  // The predecessor keeps delivering until its successor has headers
  backend_.poll(0)->receive("{\"n\":2}\n");
  backend_.poll(1)->receive("{\"n\":3}\n");

  EXPECT_TRUE(backend_.poll(0)->aborted);
  EXPECT_EQ(transport_->current_request()->previous_request(), nullptr);
  EXPECT_EQ(messages(), (std::vector<json>{json::parse(R"({"n":1})"), json::parse(R"({"n":2})"),
                                           json::parse(R"({"n":3})")}));

  scheduler_.advance(25s);
  ASSERT_EQ(backend_.polls().size(), 3u);
  EXPECT_EQ(backend_.poll(2)->url, "http://localhost:9000/peerjs/abc/tkn/id?i=2");
}

TEST_F(ChainedPollTransportTest, PollFailureEmitsDisconnectedAndStopsChain) {
  transport_->start("abc", "tkn");
  backend_.poll(0)->fail(boost::asio::error::connection_refused);

  EXPECT_EQ(count(SocketEvent::Disconnected), 1u);

  scheduler_.advance(60s);
  EXPECT_EQ(backend_.polls().size(), 1u);
}

TEST_F(ChainedPollTransportTest, PollWithoutHeadersTimesOut) {
  transport_->start("abc", "tkn");

  scheduler_.advance(5s);

  EXPECT_EQ(count(SocketEvent::Disconnected), 1u);
  EXPECT_TRUE(backend_.poll(0)->aborted);
}

TEST_F(ChainedPollTransportTest, SendFailureIsNonFatalAndChainContinues) {
  backend_.set_throw_on_send(true);
  transport_->start("abc", "tkn");

  EXPECT_TRUE(events_.empty());
  EXPECT_FALSE(transport_->is_disconnected());

  backend_.set_throw_on_send(false);
  scheduler_.advance(25s);

  ASSERT_EQ(backend_.polls().size(), 2u);
  EXPECT_TRUE(backend_.poll(1)->sent);
}

TEST_F(ChainedPollTransportTest, OutboundPostFailureIsNonFatal) {
  transport_->start("abc", "tkn");
  backend_.set_throw_on_send(true);

  transport_->send({{"type", "ANSWER"}});

  EXPECT_TRUE(events_.empty());
  EXPECT_FALSE(transport_->is_disconnected());
}

TEST_F(ChainedPollTransportTest, CloseIsIdempotentAndSilencesTransport) {
  transport_->start("abc", "tkn");
  auto poll = backend_.poll(0);
  poll->receive("{\"a\":1}\n");

  transport_->close();
  transport_->close();

  EXPECT_TRUE(transport_->is_disconnected());
  EXPECT_TRUE(poll->aborted);
  EXPECT_EQ(scheduler_.pending(), 0u);

  poll->receive("{\"b\":2}\n");
  transport_->send({{"type", "OFFER"}});
  scheduler_.advance(60s);

  EXPECT_EQ(messages().size(), 1u);
  EXPECT_TRUE(backend_.posts().empty());
  EXPECT_EQ(backend_.polls().size(), 1u);
}

TEST_F(ChainedPollTransportTest, CloseAlsoStopsPredecessor) {
  transport_->start("abc", "tkn");
  backend_.poll(0)->receive("{\"n\":1}\n");
  scheduler_.advance(25s);

  transport_->close();

  EXPECT_TRUE(backend_.poll(0)->aborted);
  EXPECT_TRUE(backend_.poll(1)->aborted);
}

TEST_F(ChainedPollTransportTest, StartAfterCloseIsIgnored) {
  transport_->start("abc", "tkn");
  transport_->close();
  transport_->start("abc", "tkn");

  EXPECT_TRUE(transport_->is_disconnected());
  EXPECT_EQ(backend_.polls().size(), 1u);
}

TEST_F(ChainedPollTransportTest, ListenerClosingStopsRemainingLines) {
  transport_->on_event([this](const ChannelEvent& event) {
    events_.push_back(event);
    transport_->close();
  });
  transport_->start("abc", "tkn");

  backend_.poll(0)->receive("{\"n\":1}\n{\"n\":2}\n{\"n\":3}\n");

  EXPECT_EQ(messages().size(), 1u);
}
