#include "../test_utils.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <toolbridge/client.hpp>
#include <toolbridge/errors.hpp>
#include <toolbridge/version.hpp>

using namespace toolbridge;
using namespace toolbridge::test;

namespace
{
json first_written(ScriptState& state, const std::string& method)
{
    for (const auto& msg : state.written_json())
        if (msg.contains("method") && msg["method"] == method)
            return msg;
    return json();
}
} // namespace

// ============================================================================
// Handshake
// ============================================================================

TEST(ClientHandshakeTest, ConnectReachesReady)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);

    EXPECT_EQ(client->state(), ConnectionState::Disconnected);
    client->connect();

    EXPECT_EQ(client->state(), ConnectionState::Ready);
    EXPECT_TRUE(client->is_ready());
    EXPECT_EQ(state->start_calls, 1);
    EXPECT_EQ(state->count_written("initialize"), 1u);
    EXPECT_EQ(state->count_written("initialized"), 1u);
}

TEST(ClientHandshakeTest, InitializeRequestShape)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    auto writes = state->written_json();
    ASSERT_EQ(writes.size(), 2u);

    const json& init = writes[0];
    EXPECT_EQ(init["jsonrpc"], "2.0");
    EXPECT_EQ(init["id"], 1);
    EXPECT_EQ(init["method"], "initialize");
    EXPECT_EQ(init["params"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(init["params"]["capabilities"]["roots"]["listChanged"], true);
    EXPECT_EQ(init["params"]["capabilities"]["sampling"], json::object());
    EXPECT_EQ(init["params"]["capabilities"]["tools"]["listChanged"], true);
    EXPECT_EQ(init["params"]["clientInfo"]["name"], "toolbridge");
    EXPECT_EQ(init["params"]["clientInfo"]["version"], version_string());

    const json& initialized = writes[1];
    EXPECT_EQ(initialized["method"], "initialized");
    EXPECT_FALSE(initialized.contains("id"));
}

TEST(ClientHandshakeTest, CapabilitiesFollowOptions)
{
    ClientOptions options = quiet_options();
    options.sampling_enabled = false;
    options.roots_list_changed = false;
    options.client_name = "agent";
    options.client_version = "9.9";
    options.initialized_notification = "notifications/initialized";

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();

    json init = first_written(*state, "initialize");
    EXPECT_FALSE(init["params"]["capabilities"].contains("sampling"));
    EXPECT_EQ(init["params"]["capabilities"]["roots"]["listChanged"], false);
    EXPECT_EQ(init["params"]["clientInfo"]["name"], "agent");
    EXPECT_EQ(init["params"]["clientInfo"]["version"], "9.9");
    EXPECT_EQ(state->count_written("notifications/initialized"), 1u);
    EXPECT_EQ(state->count_written("initialized"), 0u);
}

TEST(ClientHandshakeTest, ServerInfoRetained)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    EXPECT_FALSE(client->server_info().has_value());

    client->connect();
    auto info = client->server_info();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ((*info)["serverInfo"]["name"], "scripted");

    client->close();
    EXPECT_FALSE(client->server_info().has_value());
}

TEST(ClientHandshakeTest, RejectedHandshakeSendsNoNotification)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->results.clear();
    state->errors["initialize"] = json{{"code", -32600}, {"message", "unsupported version"}};

    try
    {
        client->connect();
        FAIL() << "Expected HandshakeRejectedError";
    }
    catch (const HandshakeRejectedError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::HandshakeRejected);
        ASSERT_NE(e.data(), nullptr);
        EXPECT_EQ((*e.data())["code"], -32600);
        EXPECT_NE(std::string(e.what()).find("unsupported version"), std::string::npos);
    }

    EXPECT_EQ(client->state(), ConnectionState::Disconnected);
    EXPECT_EQ(state->count_written("initialized"), 0u);
    EXPECT_EQ(state->terminate_calls, 1);
}

TEST(ClientHandshakeTest, EndOfStreamBeforeReply)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->results.clear();
    state->push("booting...");

    EXPECT_THROW(client->connect(), NoResponseError);
    EXPECT_EQ(client->state(), ConnectionState::Disconnected);
    EXPECT_EQ(state->count_written("initialized"), 0u);
}

TEST(ClientHandshakeTest, SpawnFailureLeavesClientReusable)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->fail_start = true;

    EXPECT_THROW(client->connect(), ProcessSpawnError);
    EXPECT_EQ(client->state(), ConnectionState::Disconnected);
    EXPECT_TRUE(state->writes().empty());

    state->fail_start = false;
    client->connect();
    EXPECT_EQ(client->state(), ConnectionState::Ready);
    EXPECT_EQ(first_written(*state, "initialize")["id"], 1);
}

TEST(ClientHandshakeTest, NoiseBeforeInitializeReply)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->noise_before_reply = {"undefined", "", "Weather MCP server running on stdio",
                                 "{\"partial\":"};

    client->connect();
    EXPECT_TRUE(client->is_ready());
}

TEST(ClientHandshakeTest, ConnectTwiceIsNoop)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();
    client->connect();

    EXPECT_EQ(state->start_calls, 1);
    EXPECT_EQ(state->count_written("initialize"), 1u);
}

TEST(ClientHandshakeTest, ConnectAfterCloseFails)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->close();

    EXPECT_THROW(client->connect(), TransportClosedError);
    EXPECT_EQ(state->start_calls, 0);
}

// ============================================================================
// Calls
// ============================================================================

TEST(ClientCallTest, CallBeforeConnectTouchesNothing)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);

    EXPECT_THROW(client->call("tools/list"), NotConnectedError);
    EXPECT_THROW(client->notify("notifications/cancelled"), NotConnectedError);
    EXPECT_EQ(state->start_calls, 0);
    EXPECT_TRUE(state->writes().empty());
}

TEST(ClientCallTest, RequestIdsIncreaseFromTwo)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->results["tools/list"] = json{{"tools", json::array()}};
    client->connect();

    client->call("tools/list");
    client->call("tools/list");

    std::vector<json> lists;
    for (const auto& msg : state->written_json())
        if (msg.contains("method") && msg["method"] == "tools/list")
            lists.push_back(msg);

    ASSERT_EQ(lists.size(), 2u);
    EXPECT_EQ(lists[0]["id"], 2);
    EXPECT_EQ(lists[1]["id"], 3);
}

TEST(ClientCallTest, ReturnsResultPayload)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->results["tools/list"] = json{{"tools", {{{"name", "echo"}}}}};
    client->connect();

    json result = client->list_tools();
    ASSERT_TRUE(result["tools"].is_array());
    EXPECT_EQ(result["tools"][0]["name"], "echo");
}

TEST(ClientCallTest, CallToolWrapsNameAndArguments)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->results["tools/call"] = json{{"content", json::array()}};
    client->connect();

    client->call_tool("get_weather", json{{"location", "Austin"}});
    client->call_tool("ping_tool", nullptr);

    std::vector<json> calls;
    for (const auto& msg : state->written_json())
        if (msg.contains("method") && msg["method"] == "tools/call")
            calls.push_back(msg);

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0]["params"]["name"], "get_weather");
    EXPECT_EQ(calls[0]["params"]["arguments"]["location"], "Austin");
    EXPECT_EQ(calls[1]["params"]["arguments"], json::object());
}

TEST(ClientCallTest, ErrorReplyRaisesServerError)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    state->errors["tools/call"] = json{{"code", -32602}, {"message", "Unknown tool"}};
    client->connect();

    try
    {
        client->call_tool("missing", json::object());
        FAIL() << "Expected ServerError";
    }
    catch (const ServerError& e)
    {
        EXPECT_EQ(e.code(), -32602);
        ASSERT_NE(e.data(), nullptr);
        EXPECT_EQ((*e.data())["message"], "Unknown tool");
    }

    // Still usable afterwards
    EXPECT_TRUE(client->is_ready());
}

TEST(ClientCallTest, NoiseUpToCeilingIsTolerated)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = std::vector<std::string>(10, "undefined");

    EXPECT_NO_THROW(client->call("tools/list"));
}

TEST(ClientCallTest, NoiseBeyondCeilingFails)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = std::vector<std::string>(11, "not json");

    try
    {
        client->call("tools/list");
        FAIL() << "Expected MaxAttemptsExceededError";
    }
    catch (const MaxAttemptsExceededError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::MaxAttemptsExceeded);
        EXPECT_EQ(e.attempts(), 11);
    }
}

TEST(ClientCallTest, CeilingIsConfigurable)
{
    ClientOptions options = quiet_options();
    options.max_skipped_lines = 0;

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = {""};

    EXPECT_THROW(client->call("tools/list"), MaxAttemptsExceededError);
}

TEST(ClientCallTest, UnrelatedEnvelopesAreSkippedWithoutCounting)
{
    ClientOptions options = quiet_options();
    options.max_skipped_lines = 0;

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = {
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{"level":"info"}})",
        R"({"jsonrpc":"2.0","id":99,"result":{"stale":true}})",
    };

    json result = client->call("tools/list");
    EXPECT_TRUE(result["tools"].is_array());
}

TEST(ClientCallTest, AnswersServerRequests)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = {
        R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})",
        R"({"jsonrpc":"2.0","id":"srv-2","method":"sampling/createMessage","params":{}})",
    };

    client->call("tools/list");

    json pong;
    json declined;
    for (const auto& msg : state->written_json())
    {
        if (msg.contains("id") && msg["id"] == "srv-1")
            pong = msg;
        if (msg.contains("id") && msg["id"] == "srv-2")
            declined = msg;
    }

    EXPECT_EQ(pong["result"], json::object());
    EXPECT_EQ(declined["error"]["code"], -32601);
}

TEST(ClientCallTest, UnattributedErrorIsTheAnswer)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    state->results["tools/list"] = json{{"tools", json::array()}};
    state->noise_before_reply = {
        R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error"}})"};

    try
    {
        client->call("tools/list");
        FAIL() << "Expected ServerError";
    }
    catch (const ServerError& e)
    {
        EXPECT_EQ(e.code(), -32700);
    }
}

TEST(ClientCallTest, EndOfStreamDuringCall)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    EXPECT_THROW(client->call("tools/list"), NoResponseError);
}

TEST(ClientCallTest, ReadTimeout)
{
    ClientOptions options = quiet_options();
    options.read_timeout = std::chrono::milliseconds(50);

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();
    state->block_when_empty = true;

    EXPECT_THROW(client->call("tools/list"), ReadTimeoutError);
}

// Valid envelopes that are not the reply still count against read_timeout
TEST(ClientCallTest, NotificationStreamHitsReadTimeout)
{
    ClientOptions options = quiet_options();
    options.read_timeout = std::chrono::milliseconds(200);

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();
    state->repeat_when_empty =
        json{{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {{"level", "info"}}}}
            .dump();

    auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client->call("tools/list"), ReadTimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_TRUE(client->is_ready());
}

TEST(ClientCallTest, StaleRepliesHitReadTimeout)
{
    ClientOptions options = quiet_options();
    options.read_timeout = std::chrono::milliseconds(200);

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();
    state->repeat_when_empty = json{{"jsonrpc", "2.0"}, {"id", 999}, {"result", {}}}.dump();

    EXPECT_THROW(client->call("tools/list"), ReadTimeoutError);
}

// The deadline covers the whole call, not each line
TEST(ClientCallTest, ReplyWithinDeadlineAfterNotifications)
{
    ClientOptions options = quiet_options();
    options.read_timeout = std::chrono::milliseconds(2000);

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();
    for (int i = 0; i < 50; ++i)
        state->push(json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}}.dump());
    state->results["tools/list"] = json{{"tools", json::array()}};

    EXPECT_EQ(client->call("tools/list"), json({{"tools", json::array()}}));
}

TEST(ClientCallTest, NotifyWritesNotification)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    client->notify("notifications/roots/list_changed");

    json note = first_written(*state, "notifications/roots/list_changed");
    EXPECT_FALSE(note.contains("id"));
}

// ============================================================================
// Close
// ============================================================================

TEST(ClientCloseTest, CloseTwiceIsNoop)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    client->close();
    client->close();

    EXPECT_EQ(client->state(), ConnectionState::Closed);
    EXPECT_EQ(state->terminate_calls, 1);
}

TEST(ClientCloseTest, CallAfterCloseIsTransportClosed)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();
    size_t writes_before = state->writes().size();

    client->close();

    try
    {
        client->call("tools/list");
        FAIL() << "Expected TransportClosedError";
    }
    catch (const TransportClosedError& e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::TransportClosed);
    }
    EXPECT_EQ(state->writes().size(), writes_before);
}

TEST(ClientCloseTest, CloseUnblocksPendingCall)
{
    ClientOptions options = quiet_options();
    options.read_timeout = std::chrono::milliseconds(0);

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    client->connect();
    state->block_when_empty = true;

    std::atomic<bool> got_closed{false};
    std::thread caller(
        [&]
        {
            try
            {
                client->call("tools/list");
            }
            catch (const TransportClosedError&)
            {
                got_closed = true;
            }
            catch (const ToolbridgeError&)
            {
            }
        });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    client->close();
    caller.join();

    EXPECT_TRUE(got_closed);
}

TEST(ClientCloseTest, DestructorCloses)
{
    std::shared_ptr<ScriptState> state;
    {
        auto client = make_client(state);
        client->connect();
    }
    EXPECT_EQ(state->terminate_calls, 1);
}

TEST(ClientCloseTest, MovedFromClientReportsClosed)
{
    std::shared_ptr<ScriptState> state;
    auto client = make_client(state);
    client->connect();

    ProtocolClient moved(std::move(*client));
    EXPECT_TRUE(moved.is_ready());
    EXPECT_EQ(client->state(), ConnectionState::Closed);
    EXPECT_THROW(client->call("tools/list"), TransportClosedError);
}

TEST(ClientCloseTest, MovedFromClientKeepsDefaultOptions)
{
    ClientOptions options = quiet_options();
    options.client_name = "custom";

    std::shared_ptr<ScriptState> state;
    auto client = make_client(state, options);
    ProtocolClient moved(std::move(*client));

    EXPECT_EQ(moved.options().client_name, "custom");
    EXPECT_EQ(client->options().client_name, ClientOptions{}.client_name);
}
