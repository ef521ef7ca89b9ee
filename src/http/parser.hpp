// httpgate HTTP Parser - Header
// Incremental HTTP/1.x parser wrapper around llhttp

#pragma once

#include <llhttp.h>

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>

#include "http.hpp"

namespace httpgate::http {

/// Parse result
enum class ParseResult : uint8_t {
    Complete,    // Message finished; bytes past `consumed` belong to the next message
    Incomplete,  // All input consumed, need more data
    Error        // Malformed input
};

enum class MessageKind : uint8_t { Request, Response };

/// Incremental HTTP/1.x parser (wraps llhttp).
///
/// The gateway relays message bytes verbatim; the parser is used to learn the
/// head and to find the exact end of the message, so framing (Content-Length,
/// chunked, EOF-delimited) is preserved end to end. The parser pauses at the
/// end of every message; call reset() before parsing the next one.
class Parser {
public:
    explicit Parser(MessageKind kind);
    ~Parser() = default;

    // Non-copyable, non-movable (llhttp keeps a pointer to the settings/context)
    Parser(const Parser&) = delete;
    Parser& operator=(const Parser&) = delete;

    /// Feed raw bytes. Returns the result and number of bytes consumed.
    [[nodiscard]] std::pair<ParseResult, size_t> feed(std::span<const uint8_t> data);

    /// Signal end of stream. Completes EOF-delimited response bodies.
    [[nodiscard]] ParseResult finish();

    /// Reset for the next message of the same kind
    void reset();

    /// Response parsing only: the request was HEAD, so the response has no body
    void set_expect_no_body(bool value) noexcept { ctx_.expect_no_body = value; }

    [[nodiscard]] bool headers_complete() const noexcept { return ctx_.headers_complete; }
    [[nodiscard]] bool message_complete() const noexcept { return ctx_.message_complete; }

    /// True if the body can only end when the peer closes the connection
    [[nodiscard]] bool needs_eof() const noexcept;

    [[nodiscard]] const RequestHead& request() const noexcept { return ctx_.request; }
    [[nodiscard]] const ResponseHead& response() const noexcept { return ctx_.response; }

    /// Get last error message
    [[nodiscard]] std::string_view error_message() const noexcept;

    /// Get last llhttp error code
    [[nodiscard]] llhttp_errno_t error_code() const noexcept { return ctx_.error; }

private:
    // llhttp callbacks
    static int on_message_begin(llhttp_t* parser);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_status(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_headers_complete(llhttp_t* parser);
    static int on_message_complete(llhttp_t* parser);

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // Parsing context (used by callbacks)
    struct Context {
        MessageKind kind = MessageKind::Request;
        RequestHead request;
        ResponseHead response;

        bool last_was_field = false;
        bool headers_complete = false;
        bool message_complete = false;
        bool expect_no_body = false;
        llhttp_errno_t error = HPE_OK;

        [[nodiscard]] HeaderList& headers() noexcept {
            return kind == MessageKind::Request ? request.headers : response.headers;
        }
    };

    Context ctx_;
};

}  // namespace httpgate::http
