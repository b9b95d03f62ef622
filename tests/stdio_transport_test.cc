#include "core/server.h"
#include "protocol/json_rpc.h"
#include "transport/stdio_transport.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

using namespace treescout;
using json = nlohmann::json;

namespace {

    std::vector<json> output_lines(const std::string &out) {
        std::vector<json> lines;
        std::istringstream in(out);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(json::parse(line));
        }
        return lines;
    }

}// namespace

TEST(StdioTransportTest, WritesOneLinePerReply) {
    std::istringstream in("first\nsecond\n");
    std::ostringstream out;
    transport::StdioTransport transport(in, out);

    auto handled = transport.run([](const std::string &line) -> std::optional<std::string> {
        return "\"" + line + "\"";
    });
    EXPECT_EQ(handled, 2u);
    EXPECT_EQ(out.str(), "\"first\"\n\"second\"\n");
    EXPECT_FALSE(transport.is_running());
}

TEST(StdioTransportTest, SkipsBlankLinesAndStripsCarriageReturn) {
    std::istringstream in("\n   \nping\r\n\t\n");
    std::ostringstream out;
    transport::StdioTransport transport(in, out);

    std::vector<std::string> seen;
    auto handled = transport.run([&seen](const std::string &line) -> std::optional<std::string> {
        seen.push_back(line);
        return std::nullopt;
    });
    EXPECT_EQ(handled, 1u);
    EXPECT_EQ(seen, (std::vector<std::string>{"ping"}));
    EXPECT_TRUE(out.str().empty());
}

TEST(StdioTransportTest, ThrowingHandlerDoesNotEndSession) {
    std::istringstream in("bad\ngood\n");
    std::ostringstream out;
    transport::StdioTransport transport(in, out);

    auto handled = transport.run([](const std::string &line) -> std::optional<std::string> {
        if (line == "bad") {
            throw std::runtime_error("handler exploded");
        }
        return std::string("{}");
    });
    EXPECT_EQ(handled, 2u);

    auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0]["error"]["code"], protocol::error_code::INTERNAL_ERROR);
    EXPECT_TRUE(lines[0]["id"].is_null());
    EXPECT_EQ(lines[1], json::object());
}

TEST(StdioTransportTest, ServerAnswersEachRequestInOrder) {
    auto server = core::TreeScoutServer::Builder().build();
    std::istringstream in(
            "{this is not json\n"
            "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
            "\n"
            "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
            "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/list\"}\n");
    std::ostringstream out;

    auto handled = server->run(in, out);
    EXPECT_EQ(handled, 4u);

    auto lines = output_lines(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0]["error"]["code"], protocol::error_code::PARSE_ERROR);
    EXPECT_EQ(lines[1]["id"], 1);
    EXPECT_EQ(lines[2]["id"], 2);
    EXPECT_EQ(lines[2]["result"]["tools"].size(), 13u);
}
