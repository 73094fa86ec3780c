/*
 * Copyright 2025 Hopstrip Contributors
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


// Hopstrip HTTP Parser - Implementation

#include "parser.hpp"

namespace hopstrip::http {

Parser::Parser() {
    // Initialize llhttp settings
    llhttp_settings_init(&settings_);

    // Register callbacks
    settings_.on_message_begin = on_message_begin;
    settings_.on_url = on_url;
    settings_.on_status = on_status;
    settings_.on_header_field = on_header_field;
    settings_.on_header_value = on_header_value;
    settings_.on_header_value_complete = on_header_value_complete;
    settings_.on_headers_complete = on_headers_complete;
    settings_.on_body = on_body;
    settings_.on_message_complete = on_message_complete;

    // Initialize parser
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = &ctx_;
}

Parser::~Parser() = default;

Parser::Parser(Parser&& other) noexcept
    : parser_(other.parser_)
    , settings_(other.settings_)
    , ctx_(other.ctx_)
    , parser_type_(other.parser_type_)
    , request_base_(other.request_base_)
    , request_fed_(other.request_fed_) {
    parser_.settings = &settings_;
    parser_.data = &ctx_;
}

Parser& Parser::operator=(Parser&& other) noexcept {
    if (this != &other) {
        parser_ = other.parser_;
        settings_ = other.settings_;
        ctx_ = other.ctx_;
        parser_type_ = other.parser_type_;
        request_base_ = other.request_base_;
        request_fed_ = other.request_fed_;
        parser_.settings = &settings_;
        parser_.data = &ctx_;
    }
    return *this;
}

void Parser::switch_type(llhttp_type_t type) {
    if (parser_type_ != type) {
        llhttp_init(&parser_, type, &settings_);
        parser_.data = &ctx_;
        parser_type_ = type;
        request_base_ = nullptr;
        request_fed_ = 0;
    }
}

std::pair<ParseResult, size_t> Parser::parse_request(
    std::span<const uint8_t> data,
    Request& request) {

    switch_type(HTTP_REQUEST);

    // Views collected so far point into the old bytes: start the message over
    if (request_fed_ > 0 && (data.data() != request_base_ || data.size() < request_fed_)) {
        reset();
        request = Request{};
    }

    ctx_.request = &request;
    ctx_.response = nullptr;
    ctx_.skip_body = false;

    request_base_ = data.data();
    auto [result, consumed] = execute(data.subspan(request_fed_));
    consumed += request_fed_;
    request_fed_ = consumed;

    if (result == ParseResult::Complete) {
        request.raw = data.subspan(0, consumed);
    }
    return {result, consumed};
}

std::pair<ParseResult, size_t> Parser::parse_response(
    std::span<const uint8_t> data,
    Response& response,
    bool no_body) {

    switch_type(HTTP_RESPONSE);

    ctx_.request = nullptr;
    ctx_.response = &response;
    ctx_.skip_body = no_body;

    return execute(data);
}

std::pair<ParseResult, size_t> Parser::execute(std::span<const uint8_t> data) {
    ctx_.message_complete = false;
    ctx_.error = HPE_OK;

    llhttp_errno_t err = llhttp_execute(
        &parser_,
        reinterpret_cast<const char*>(data.data()),
        data.size());

    size_t consumed = data.size();

    // on_message_complete pauses the parser so the next pipelined message is left untouched
    if (err == HPE_PAUSED || err == HPE_PAUSED_UPGRADE) {
        const char* pause_pos = llhttp_get_error_pos(&parser_);
        if (pause_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(pause_pos) - data.data());
        }
        llhttp_resume(&parser_);
        if (err == HPE_PAUSED_UPGRADE) {
            llhttp_resume_after_upgrade(&parser_);
        }
        if (ctx_.message_complete || err == HPE_PAUSED_UPGRADE) {
            return {ParseResult::Complete, consumed};
        }
        return {ParseResult::Incomplete, consumed};
    }

    if (err != HPE_OK) {
        const char* error_pos = llhttp_get_error_pos(&parser_);
        if (error_pos) {
            consumed = static_cast<size_t>(
                reinterpret_cast<const uint8_t*>(error_pos) - data.data());
        }
        ctx_.error = err;
        return {ParseResult::Error, consumed};
    }

    if (ctx_.message_complete) {
        return {ParseResult::Complete, consumed};
    }

    // Need more data
    return {ParseResult::Incomplete, consumed};
}

ParseResult Parser::finish() {
    llhttp_errno_t err = llhttp_finish(&parser_);
    if (err != HPE_OK && err != HPE_PAUSED) {
        ctx_.error = err;
        return ParseResult::Error;
    }
    return ctx_.message_complete ? ParseResult::Complete : ParseResult::Incomplete;
}

void Parser::reset() {
    llhttp_init(&parser_, parser_type_, &settings_);
    parser_.data = &ctx_;
    ctx_ = Context{};
    request_base_ = nullptr;
    request_fed_ = 0;
}

std::string_view Parser::error_message() const noexcept {
    if (ctx_.error == HPE_OK) {
        return "";
    }
    return llhttp_errno_name(ctx_.error);
}

llhttp_errno_t Parser::error_code() const noexcept {
    return ctx_.error;
}

// Callbacks

int Parser::on_message_begin(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    ctx->message_complete = false;
    ctx->informational = false;
    ctx->headers_complete = false;
    ctx->field_start = nullptr;
    ctx->field_length = 0;
    ctx->value_start = nullptr;
    ctx->value_length = 0;
    ctx->field_name.clear();
    ctx->field_value.clear();
    ctx->error = HPE_OK;
    return 0;
}

int Parser::on_url(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request) return -1;

    // URL may arrive in several spans; they are contiguous in the buffer
    const char* start = ctx->request->uri.empty() ? at : ctx->request->uri.data();
    ctx->request->uri = std::string_view(start, static_cast<size_t>(at + length - start));

    // Split path and query
    size_t query_pos = ctx->request->uri.find('?');
    if (query_pos != std::string_view::npos) {
        ctx->request->path = ctx->request->uri.substr(0, query_pos);
        ctx->request->query = ctx->request->uri.substr(query_pos + 1);
    } else {
        ctx->request->path = ctx->request->uri;
        ctx->request->query = {};
    }

    return 0;
}

int Parser::on_status(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->response) return 0; // Only used for response parsing

    ctx->response->reason_phrase.append(at, length);
    return 0;
}

int Parser::on_header_field(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    // Chunked trailer fields are dropped
    if (ctx->headers_complete) return 0;
    if (ctx->request) {
        // Spans of one field name are contiguous in the request buffer
        if (ctx->field_start == nullptr) {
            ctx->field_start = at;
        }
        ctx->field_length = static_cast<size_t>(at + length - ctx->field_start);
        return 0;
    }
    if (!ctx->response) return -1;

    ctx->field_name.append(at, length);
    return 0;
}

int Parser::on_header_value(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (ctx->headers_complete) return 0;
    if (ctx->request) {
        if (ctx->value_start == nullptr) {
            ctx->value_start = at;
        }
        ctx->value_length = static_cast<size_t>(at + length - ctx->value_start);
        return 0;
    }
    if (!ctx->response) return -1;

    ctx->field_value.append(at, length);
    return 0;
}

int Parser::on_header_value_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (ctx->headers_complete) return 0;
    if (ctx->request) {
        ctx->request->headers.push_back(
            {std::string_view(ctx->field_start, ctx->field_length),
             ctx->value_start ? std::string_view(ctx->value_start, ctx->value_length)
                              : std::string_view{}});
        ctx->field_start = nullptr;
        ctx->field_length = 0;
        ctx->value_start = nullptr;
        ctx->value_length = 0;
        return 0;
    }
    if (!ctx->response) return -1;

    ctx->response->headers.add(ctx->field_name, ctx->field_value);
    ctx->field_name.clear();
    ctx->field_value.clear();
    return 0;
}

int Parser::on_headers_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (!ctx->request && !ctx->response) return -1;
    ctx->headers_complete = true;

    // Extract version (common to both request and response)
    uint8_t major = parser->http_major;
    uint8_t minor = parser->http_minor;
    Version version = Version::UNKNOWN;
    if (major == 1 && minor == 0) {
        version = Version::HTTP_1_0;
    } else if (major == 1 && minor == 1) {
        version = Version::HTTP_1_1;
    } else if (major == 2 && minor == 0) {
        version = Version::HTTP_2_0;
    }

    if (ctx->request) {
        ctx->request->method = parse_method(llhttp_method_name(
            static_cast<llhttp_method_t>(llhttp_get_method(parser))));
        ctx->request->version = version;
        return 0;
    }

    uint16_t status = parser->status_code;
    ctx->response->status = static_cast<StatusCode>(status);
    ctx->response->version = version;

    // 1xx interim responses (except 101) are discarded, the final response follows
    if (status >= 100 && status < 200 && status != 101) {
        ctx->informational = true;
        return 0;
    }

    // Returning 1 tells llhttp the response has no body (HEAD requests)
    return ctx->skip_body ? 1 : 0;
}

int Parser::on_body(llhttp_t* parser, const char* at, size_t length) {
    auto* ctx = static_cast<Context*>(parser->data);
    if (ctx->request) return 0; // forwarded as raw bytes
    if (!ctx->response) return -1;

    // Chunked bodies arrive in several spans; append the decoded bytes
    const auto* bytes = reinterpret_cast<const uint8_t*>(at);
    ctx->response->body.insert(ctx->response->body.end(), bytes, bytes + length);
    return 0;
}

int Parser::on_message_complete(llhttp_t* parser) {
    auto* ctx = static_cast<Context*>(parser->data);

    if (ctx->informational && ctx->response) {
        ctx->response->headers.clear();
        ctx->response->body.clear();
        ctx->response->reason_phrase.clear();
        ctx->informational = false;
        return 0;
    }

    ctx->message_complete = true;
    return HPE_PAUSED;
}

} // namespace hopstrip::http
