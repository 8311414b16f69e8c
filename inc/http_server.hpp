#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/optional.hpp>

#include <chrono>
#include <map>
#include <string>

#ifndef HTTP_READ_HEADER_BUFFER
#define HTTP_READ_HEADER_BUFFER 8192
#endif

#ifndef HTTP_READ_BODY_LIMIT
#define HTTP_READ_BODY_LIMIT 64*1024
#endif

#ifndef HTTP_REQUEST_DEADLINE_SECONDS
#define HTTP_REQUEST_DEADLINE_SECONDS 60
#endif

// status, content type and body answering one request
struct http_reply {
    boost::beast::http::status status;
    std::string content_type;
    std::string body;
};

class http_worker {
  public:
    // disable copy constructor and copy assignment (non-copyable)
    http_worker(http_worker const&) = delete;
    http_worker& operator=(http_worker const&) = delete;

    http_worker(boost::asio::ip::tcp::acceptor& acceptor);

    void start();

    static bool url_decode(const std::string& in, std::string& out);

    // query string parameters of a request target, values still url-encoded
    static std::map<std::string, std::string> parse(const std::string& target);

    // GET /outline?path=...[&upw=...] answers with the outline JSON,
    // anything else with the matching client error
    static http_reply route(boost::beast::http::verb method, const std::string& target);

  private:
    using request_body_t = boost::beast::http::string_body;

    // The acceptor used to listen for incoming connections.
    boost::asio::ip::tcp::acceptor& acceptor_;

    // The socket for the currently connected client.
    boost::asio::ip::tcp::socket socket_{acceptor_.get_executor()};

    // The buffer for performing reads
    boost::beast::flat_static_buffer<HTTP_READ_HEADER_BUFFER> buffer_;

    // The parser for reading the requests
    boost::optional<boost::beast::http::request_parser<request_body_t>> parser_;

    // The timer putting a time limit on requests.
    boost::asio::steady_timer request_deadline_{acceptor_.get_executor(), (std::chrono::steady_clock::time_point::max)()};

    // The string-based response message.
    boost::optional<boost::beast::http::response<boost::beast::http::string_body>> string_response_;

    // The string-based response serializer.
    boost::optional<boost::beast::http::response_serializer<boost::beast::http::string_body>> string_serializer_;

    void accept();

    void read_request();

    void process_request(boost::beast::http::request<request_body_t> const& req);

    void send_response(boost::beast::http::status status, std::string const& content_type, std::string body);

    void check_deadline();
};
