// src/transport/stdio_transport.cpp
#include "stdio_transport.h"
#include "core/logger.h"
#include "protocol/json_rpc.h"
#include <iostream>

namespace treescout::transport {

    StdioTransport::StdioTransport() : StdioTransport(std::cin, std::cout) {
    }

    StdioTransport::StdioTransport(std::istream &in, std::ostream &out) : in_(in), out_(out) {
    }

    size_t StdioTransport::run(const MessageHandler &on_message) {
        TREESCOUT_INFO("STDIO Transport started, waiting for input...");
        running_ = true;
        size_t handled = 0;

        std::string line;
        while (running_ && std::getline(in_, line)) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (line.find_first_not_of(" \t") == std::string::npos) {
                continue;
            }

            ++handled;
            std::optional<std::string> reply;
            try {
                reply = on_message(line);
            } catch (const std::exception &e) {
                // one bad line must not end the session
                TREESCOUT_ERROR("Handler failed on input line: {}", e.what());
                reply = protocol::make_error(protocol::error_code::INTERNAL_ERROR,
                                             "Internal error", nlohmann::json(nullptr),
                                             nlohmann::json{{"detail", e.what()}});
            }

            if (reply && !write(*reply)) {
                TREESCOUT_ERROR("Output stream closed, stopping");
                break;
            }
        }

        running_ = false;
        TREESCOUT_INFO("STDIO Transport stopped after {} messages", handled);
        return handled;
    }

    bool StdioTransport::write(const std::string &message) {
        // one message per line, flushed so the host sees it immediately
        out_ << message << '\n';
        out_.flush();
        return static_cast<bool>(out_);
    }

    void StdioTransport::close() {
        running_ = false;
    }

}// namespace treescout::transport
