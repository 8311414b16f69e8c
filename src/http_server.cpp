#include "http_server.hpp"
#include "batch_processor.hpp"
#include "logging.hpp"
#include "string_utils.hpp"
#include <boost/beast/core.hpp>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <regex>
#include <string>
#include <utility>

http_worker::http_worker(boost::asio::ip::tcp::acceptor& acceptor) :
    acceptor_(acceptor){
}

void http_worker::start() {
    accept();
    check_deadline();
}

void http_worker::accept() {
    // Clean up any previous connection.
    boost::beast::error_code ec;
    socket_.close(ec);
    buffer_.consume(buffer_.size());

    acceptor_.async_accept(
        socket_,
    [this](boost::beast::error_code ec) {
        if (ec) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            boost::beast::error_code endpoint_ec;
            boost::asio::ip::tcp::endpoint remote = socket_.remote_endpoint(endpoint_ec);
            LOG_CHANNEL_INFO(LOG_CHANNEL_HTTP) << "Accepted request from " << remote.address() << ":" << remote.port();

            // Request must be fully processed within the deadline.
            request_deadline_.expires_after(std::chrono::seconds(HTTP_REQUEST_DEADLINE_SECONDS));

            read_request();
        }
    });
}

void http_worker::read_request() {
    // On each read the parser needs to be destroyed and
    // recreated. We store it in a boost::optional to
    // achieve that.
    //
    // Requests carry their parameters in the target, so the
    // body is kept small to prevent buffer attacks.
    parser_.emplace();
    parser_->body_limit(HTTP_READ_BODY_LIMIT);

    boost::beast::http::async_read(socket_,
                                   buffer_,
                                   *parser_,
    [this](boost::beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            process_request(parser_->get());
        }
    });
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}

bool http_worker::url_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] != '%') {
            out += in[i];
        } else {
            // truncated or non-hex escapes reject the whole value
            int high = i + 2 < in.size() ? hex_value(in[i + 1]) : -1;
            int low = high >= 0 ? hex_value(in[i + 2]) : -1;
            if (low < 0) {
                return false;
            }
            out += static_cast<char>(high * 16 + low);
            i += 2;
        }
    }
    return true;
}

std::map<std::string, std::string> http_worker::parse(const std::string& target) {
    std::map<std::string, std::string> params;
    std::string::size_type question_mark = target.find('?');
    if (question_mark == std::string::npos) {
        return params;
    }
    std::string query = target.substr(question_mark + 1);

    static const std::regex param_regex("([\\w+%]+)=([^&]*)");
    for (std::sregex_iterator it(query.begin(), query.end(), param_regex), end; it != end; ++it) {
        params[(*it)[1].str()] = (*it)[2].str();
    }
    return params;
}

http_reply http_worker::route(boost::beast::http::verb method, const std::string& target) {
    if (method != boost::beast::http::verb::get) {
        // We return responses indicating an error if
        // we do not recognize the request method.
        auto method_name = boost::beast::http::to_string(method);
        return {boost::beast::http::status::bad_request, "text/plain",
                "Invalid request-method '" + std::string(method_name.data(), method_name.size()) + "'\r\n"};
    }

    /* request parameters:
     *   - required: path : pdf file path
     *   - optional: upw  : user password
     */
    std::string resource = target.substr(0, target.find('?'));
    if (resource != "/outline") {
        return {boost::beast::http::status::not_found, "text/plain", "Unknown resource '" + resource + "'\r\n"};
    }

    std::map<std::string, std::string> params = parse(target);
    std::string request_path;
    if (params.find("path") == params.end() || !url_decode(params.at("path"), request_path) || request_path.empty()) {
        return {boost::beast::http::status::bad_request, "text/plain", "Missing or malformed 'path' parameter\r\n"};
    }

    std::string user_password;
    if (params.find("upw") != params.end() && !url_decode(params.at("upw"), user_password)) {
        return {boost::beast::http::status::bad_request, "text/plain", "Malformed 'upw' parameter\r\n"};
    }

    LOG_CHANNEL_INFO(LOG_CHANNEL_HTTP) << "Processing PDF file: " << request_path;

    std::optional<Outline_Document> outline;
    try {
        outline = outline_pdf_file(request_path, user_password);
    } catch (const std::exception& e) {
        LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Failed to process " << request_path << ": " << e.what();
    }

    if (!outline) {
        nlohmann::ordered_json error;
        error["error"] = "cannot read PDF document";
        error["path"] = request_path;
        return {boost::beast::http::status::unprocessable_entity, "application/json",
                error.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace)};
    }

    return {boost::beast::http::status::ok, "application/json", format_outline_document(outline.value())};
}

void http_worker::process_request(boost::beast::http::request<request_body_t> const& req) {
    http_reply reply = route(req.method(), std::string(req.target().data(), req.target().size()));
    if (reply.status != boost::beast::http::status::ok) {
        LOG_CHANNEL_WARNING(LOG_CHANNEL_HTTP) << "Rejected request: " << static_cast<unsigned>(reply.status) << " "
                                              << trim_copy(reply.body);
    }
    send_response(reply.status, reply.content_type, std::move(reply.body));
}

void http_worker::send_response(boost::beast::http::status status, std::string const& content_type, std::string body) {
    string_response_.emplace();
    string_response_->result(status);
    string_response_->keep_alive(false);
    string_response_->set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
    string_response_->set(boost::beast::http::field::content_type, content_type);
    string_response_->body() = std::move(body);
    string_response_->prepare_payload();

    string_serializer_.emplace(*string_response_);

    boost::beast::http::async_write(
        socket_,
        *string_serializer_,
    [this](boost::beast::error_code ec, std::size_t) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        string_serializer_.reset();
        string_response_.reset();
        accept();
    });
}

void http_worker::check_deadline() {
    // The deadline may have moved, so check it has really passed.
    if (request_deadline_.expiry() <= std::chrono::steady_clock::now()) {
        // Close socket to cancel any outstanding operation.
        boost::beast::error_code ec;
        socket_.close(ec);

        // Sleep indefinitely until we're given a new deadline.
        request_deadline_.expires_at(
            std::chrono::steady_clock::time_point::max());
    }

    request_deadline_.async_wait(
    [this](boost::beast::error_code) {
        check_deadline();
    });
}
