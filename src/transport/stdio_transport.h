// src/transport/stdio_transport.h
#pragma once
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>

namespace treescout::transport {

    /**
     * @brief Line-delimited JSON over a pair of streams, stdin/stdout by default.
     *
     * run() reads a line, hands it to the handler and writes the reply before
     * reading the next one, so requests are never handled concurrently.
     */
    class StdioTransport {
    public:
        // Returns the response line, or nullopt when nothing is to be written
        using MessageHandler = std::function<std::optional<std::string>(const std::string &)>;

        StdioTransport();
        StdioTransport(std::istream &in, std::ostream &out);

        /**
         * @brief Serve until end of input, a read failure or close().
         * @return Number of lines handed to the handler
         */
        size_t run(const MessageHandler &on_message);

        bool write(const std::string &message);
        void close();
        bool is_running() const { return running_; }

    private:
        std::istream &in_;
        std::ostream &out_;
        bool running_ = false;
    };

}// namespace treescout::transport
