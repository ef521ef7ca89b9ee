/*
 * Copyright 2025 httpgate Contributors
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

// httpgate HTTP Parser - Implementation

#include "parser.hpp"

namespace httpgate::http {

Parser::Parser(MessageKind kind) {
    llhttp_settings_init(&settings_);

    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_status = on_status;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_message_complete = on_message_complete;

    ctx_.kind = kind;
    reset();
}

void Parser::reset() {
    auto kind = ctx_.kind;
    auto expect_no_body = ctx_.expect_no_body;

    llhttp_init(&parser_, kind == MessageKind::Request ? HTTP_REQUEST : HTTP_RESPONSE, &settings_);
    parser_.data = &ctx_;

    ctx_ = Context{};
    ctx_.kind = kind;
    ctx_.expect_no_body = expect_no_body;
}

std::pair<ParseResult, size_t> Parser::feed(std::span<const uint8_t> data) {
    if (ctx_.message_complete) {
        // Paused at a message boundary; the caller has to reset() first
        return {ParseResult::Complete, 0};
    }
    if (ctx_.error != HPE_OK) {
        return {ParseResult::Error, 0};
    }
    if (data.empty()) {
        return {ParseResult::Incomplete, 0};
    }

    llhttp_errno_t err =
        llhttp_execute(&parser_, reinterpret_cast<const char*>(data.data()), data.size());

    if (err == HPE_OK) {
        return {ParseResult::Incomplete, data.size()};
    }

    size_t consumed = data.size();
    if (const char* error_pos = llhttp_get_error_pos(&parser_)) {
        consumed = static_cast<size_t>(reinterpret_cast<const uint8_t*>(error_pos) - data.data());
    }

    if (err == HPE_PAUSED && ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    ctx_.error = err;
    return {ParseResult::Error, consumed};
}

ParseResult Parser::finish() {
    if (ctx_.message_complete) {
        return ParseResult::Complete;
    }

    llhttp_errno_t err = llhttp_finish(&parser_);
    if ((err == HPE_OK || err == HPE_PAUSED) && ctx_.message_complete) {
        return ParseResult::Complete;
    }

    ctx_.error = (err == HPE_OK) ? HPE_INVALID_EOF_STATE : err;
    return ParseResult::Error;
}

bool Parser::needs_eof() const noexcept {
    return llhttp_message_needs_eof(&parser_) != 0;
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->request = RequestHead{};
    ctx->response = ResponseHead{};
    ctx->last_was_field = false;
    ctx->headers_complete = false;
    ctx->message_complete = false;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    // May arrive in several pieces when the request line straddles reads
    ctx->request.target.append(at, length);
    return 0;
}

int Parser::on_status(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->response.reason.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    auto& headers = ctx->headers();

    if (!ctx->last_was_field || headers.empty()) {
        headers.push_back(Header{std::string(at, length), std::string()});
    } else {
        headers.back().name.append(at, length);
    }

    ctx->last_was_field = true;
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    auto& headers = ctx->headers();
    if (headers.empty()) {
        return -1;
    }

    headers.back().value.append(at, length);
    ctx->last_was_field = false;
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);

    Version version = Version::UNKNOWN;
    if (parser->http_major == 1 && parser->http_minor == 0) {
        version = Version::HTTP_1_0;
    } else if (parser->http_major == 1 && parser->http_minor == 1) {
        version = Version::HTTP_1_1;
    }

    bool keep_alive = llhttp_should_keep_alive(parser) != 0;
    ctx->headers_complete = true;

    if (ctx->kind == MessageKind::Request) {
        auto& request = ctx->request;
        request.method_name =
            llhttp_method_name(static_cast<llhttp_method_t>(llhttp_get_method(parser)));
        request.method = parse_method(request.method_name);
        request.version = version;
        request.keep_alive = keep_alive;
        request.has_body = (parser->flags & F_CHUNKED) != 0 ||
                           ((parser->flags & F_CONTENT_LENGTH) != 0 && parser->content_length > 0);

        size_t query_pos = request.target.find('?');
        if (query_pos != std::string::npos) {
            request.path = request.target.substr(0, query_pos);
            request.query = request.target.substr(query_pos + 1);
        } else {
            request.path = request.target;
        }
        return 0;
    }

    auto& response = ctx->response;
    response.status = parser->status_code;
    response.version = version;
    response.keep_alive = keep_alive;

    // 1 = "this message has no body" (response to HEAD)
    if (ctx->expect_no_body && !response.is_informational()) {
        return 1;
    }
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = true;

    // Keep-alive can only be judged once the body framing is known
    if (ctx->kind == MessageKind::Request) {
        ctx->request.keep_alive = llhttp_should_keep_alive(parser) != 0;
    } else {
        ctx->response.keep_alive = llhttp_should_keep_alive(parser) != 0;
    }

    // Stop exactly at the message boundary so pipelined bytes are left alone
    return HPE_PAUSED;
}

}  // namespace httpgate::http
