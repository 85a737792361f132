// Tests for the relay handshake client state machine.
#include "fakes.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <vector>

using linkpair::RelayHandshakeClient;
using linkpair::RelayOutcome;
using linkpair::fakes::FakeTransport;

namespace {

linkpair::PhoneReadyMessage Ready() {
  linkpair::PhoneReadyMessage ready;
  ready.ip = "192.168.1.5";
  ready.port = 8080;
  ready.token = "t1";
  return ready;
}

class RelayClientTest : public ::testing::Test {
 protected:
  void Connect() {
    ASSERT_TRUE(client.Connect("wss://relay.example", "s1", "phone", Ready(),
                               [this](const RelayOutcome& outcome) { outcomes.push_back(outcome); }));
  }

  FakeTransport transport;
  RelayHandshakeClient client{transport, [](const std::string&) {}};
  std::vector<RelayOutcome> outcomes;
};

}  // namespace

TEST_F(RelayClientTest, OpensRelayUrlWithSessionAndRole) {
  Connect();
  ASSERT_EQ(transport.connections.size(), 1u);
  EXPECT_EQ(transport.last().url, "wss://relay.example?sessionId=s1&role=phone");
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kConnecting);
  EXPECT_TRUE(transport.last().sent.empty());
}

TEST_F(RelayClientTest, SendsPhoneReadyOnceOnOpen) {
  Connect();
  transport.EmitOpen();
  transport.EmitOpen();

  ASSERT_EQ(transport.last().sent.size(), 1u);
  const auto frame = nlohmann::json::parse(transport.last().sent.front());
  EXPECT_EQ(frame.at("type"), "phone-ready");
  EXPECT_EQ(frame.at("ip"), "192.168.1.5");
  EXPECT_EQ(frame.at("port"), 8080);
  EXPECT_EQ(frame.at("token"), "t1");
  EXPECT_TRUE(client.ready_sent());
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kOpen);
}

TEST_F(RelayClientTest, CleanCloseAfterOpenIsSuccess) {
  Connect();
  transport.EmitOpen();
  transport.EmitClosed();

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].type, RelayOutcome::Type::kClosed);
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kClosed);
}

TEST_F(RelayClientTest, ErrorMessageIsTerminal) {
  Connect();
  transport.EmitOpen();
  transport.EmitMessage(R"({"type":"error","error":"session expired"})");
  transport.EmitClosed();
  transport.EmitError();

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].type, RelayOutcome::Type::kRelayError);
  EXPECT_EQ(outcomes[0].message, "session expired");
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kErrored);
  EXPECT_TRUE(transport.last().closed);
}

TEST_F(RelayClientTest, ErrorWithoutTextUsesFallback) {
  Connect();
  transport.EmitOpen();
  transport.EmitMessage(R"({"type":"error"})");

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].message, "Connection failed");
}

TEST_F(RelayClientTest, IgnoresOtherAndUndecodableMessages) {
  Connect();
  transport.EmitOpen();
  transport.EmitMessage(R"({"type":"browser-connected"})");
  transport.EmitMessage("garbage");
  transport.EmitMessage(R"({"error":"no type"})");

  EXPECT_TRUE(outcomes.empty());
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kOpen);
}

TEST_F(RelayClientTest, TransportErrorIsTerminal) {
  Connect();
  transport.EmitError("connection refused");
  transport.EmitOpen();

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].type, RelayOutcome::Type::kTransportError);
  EXPECT_EQ(outcomes[0].message, "Failed to connect to signaling server");
  EXPECT_FALSE(client.ready_sent());
  EXPECT_TRUE(transport.last().sent.empty());
}

TEST_F(RelayClientTest, CloseBeforeOpenIsTransportError) {
  Connect();
  transport.EmitClosed();

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].type, RelayOutcome::Type::kTransportError);
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kErrored);
}

TEST_F(RelayClientTest, CloseSuppressesOutcome) {
  Connect();
  transport.EmitOpen();
  client.Close();
  transport.EmitClosed();
  transport.EmitMessage(R"({"type":"error","error":"late"})");

  EXPECT_TRUE(outcomes.empty());
  EXPECT_TRUE(transport.last().closed);
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kClosed);
}

TEST_F(RelayClientTest, ConnectOnlyOnce) {
  Connect();
  EXPECT_FALSE(client.Connect("wss://other", "s2", "phone", Ready(), nullptr));
  EXPECT_EQ(transport.connections.size(), 1u);
}

TEST_F(RelayClientTest, RefusedTransportReportsTransportError) {
  transport.refuse = true;
  Connect();

  ASSERT_EQ(outcomes.size(), 1u);
  EXPECT_EQ(outcomes[0].type, RelayOutcome::Type::kTransportError);
  EXPECT_EQ(client.state(), RelayHandshakeClient::State::kErrored);
}

TEST(RelayClientLifetimeTest, DestructionClosesConnection) {
  FakeTransport transport;
  int outcomes = 0;
  {
    RelayHandshakeClient client(transport, [](const std::string&) {});
    client.Connect("ws://relay", "s1", "phone", Ready(),
                   [&outcomes](const RelayOutcome&) { ++outcomes; });
    transport.EmitOpen();
  }
  EXPECT_TRUE(transport.last().closed);
  // Late events after destruction must be harmless.
  transport.EmitClosed();
  EXPECT_EQ(outcomes, 0);
}

TEST(RelayStateNameTest, NamesEveryState) {
  EXPECT_STREQ(linkpair::RelayStateName(RelayHandshakeClient::State::kIdle), "idle");
  EXPECT_STREQ(linkpair::RelayStateName(RelayHandshakeClient::State::kConnecting), "connecting");
  EXPECT_STREQ(linkpair::RelayStateName(RelayHandshakeClient::State::kOpen), "open");
  EXPECT_STREQ(linkpair::RelayStateName(RelayHandshakeClient::State::kClosed), "closed");
  EXPECT_STREQ(linkpair::RelayStateName(RelayHandshakeClient::State::kErrored), "errored");
}
