#include "storage/s3_object_store.hpp"
#include "crypto/digest.hpp"
#include <cctype>
#include <ctime>
#include <future>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/err.h>

namespace bsync {
namespace storage {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "bucketsync/1.0";

// Runs the io_context until the pending operation completes, then rethrows its error if any
template <class T>
T wait_for(net::io_context& ioc, std::future<T> future) {
  ioc.restart();
  ioc.run();
  return future.get();
}

template <class Stream>
std::pair<unsigned int, std::string> exchange(net::io_context& ioc,
                                              Stream& stream,
                                              http::request<http::string_body>& request,
                                              std::chrono::seconds timeout) {
  beast::get_lowest_layer(stream).expires_after(timeout);
  wait_for(ioc, http::async_write(stream, request, net::use_future));

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
  // HEAD responses announce a Content-Length but carry no body
  if (request.method() == http::verb::head) {
    parser.skip(true);
  }

  beast::get_lowest_layer(stream).expires_after(timeout);
  wait_for(ioc, http::async_read(stream, buffer, parser, net::use_future));

  auto response = parser.release();
  return {response.result_int(), std::move(response.body())};
}

// Extracts <Code> from an S3 <Error> document; empty when absent
std::string parse_error_code(const std::string& body) {
  if (body.empty()) {
    return {};
  }
  try {
    boost::property_tree::ptree tree;
    std::istringstream in(body);
    boost::property_tree::read_xml(in, tree);
    return tree.get<std::string>("Error.Code", "");
  }
  catch (const boost::property_tree::ptree_error&) {
    return {};
  }
}

std::string strip_quotes(std::string value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

S3ObjectStore::S3ObjectStore(const S3Options& options, const std::string& bucket)
  : options_(options)
  , bucket_(bucket)
  , endpoint_(parse_endpoint(options.endpoint.empty()
                               ? "https://s3." + options.credentials.region + ".amazonaws.com"
                               : options.endpoint))
  , signer_(options.credentials) {
  if (bucket_.empty()) {
    throw StorageError(StorageErrorKind::INVALID_KEY, "Bucket name is empty");
  }
  if (options_.credentials.access_key.empty() || options_.credentials.secret_key.empty()) {
    BOOST_LOG_TRIVIAL(warning) << "S3 store: No credentials configured, requests will be rejected";
  }

  if (endpoint_.tls) {
    ssl_context_ = std::make_unique<ssl::context>(ssl::context::tls_client);
    ssl_context_->set_default_verify_paths();
    ssl_context_->set_verify_mode(ssl::verify_peer);
  }

  BOOST_LOG_TRIVIAL(info) << "S3 store: Bucket " << bucket_ << " at "
                          << (endpoint_.tls ? "https://" : "http://") << host_header();
}

S3ObjectStore::~S3ObjectStore() = default;


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void S3ObjectStore::check_bucket() {
  const std::string uri = "/" + S3Signer::uri_encode(bucket_, true);
  Response response = perform("HEAD", uri, {}, "");
  if (response.status / 100 != 2) {
    raise_for("HEAD bucket", bucket_, response);
  }
  BOOST_LOG_TRIVIAL(debug) << "S3 store: Bucket " << bucket_ << " is accessible";
}

void S3ObjectStore::put_object(const std::string& key, std::istream& data) {
  std::string body((std::istreambuf_iterator<char>(data)), std::istreambuf_iterator<char>());
  if (data.bad()) {
    throw StorageError(StorageErrorKind::OTHER, "Failed to read upload data for " + key);
  }

  Response response = perform("PUT", object_uri(key), {}, body);
  if (response.status / 100 != 2) {
    raise_for("PUT", key, response);
  }
  BOOST_LOG_TRIVIAL(debug) << "S3 store: Uploaded " << body.size() << " bytes to " << key;
}

void S3ObjectStore::get_object(const std::string& key, std::ostream& output) {
  Response response = perform("GET", object_uri(key), {}, "");
  if (response.status / 100 != 2) {
    raise_for("GET", key, response);
  }

  output.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
  if (!output.good()) {
    throw StorageError(StorageErrorKind::OTHER, "Failed to write downloaded data for " + key);
  }
  BOOST_LOG_TRIVIAL(debug) << "S3 store: Downloaded " << response.body.size() << " bytes from " << key;
}

ListPage S3ObjectStore::list_objects(const std::string& prefix, const std::string& continuation_token) {
  std::map<std::string, std::string> query{
    {"list-type", "2"},
    {"max-keys", std::to_string(options_.max_keys)}
  };
  if (!prefix.empty()) {
    query["prefix"] = prefix;
  }
  if (!continuation_token.empty()) {
    query["continuation-token"] = continuation_token;
  }

  Response response = perform("GET", "/" + S3Signer::uri_encode(bucket_, true), query, "");
  if (response.status / 100 != 2) {
    raise_for("LIST", prefix.empty() ? bucket_ : prefix, response);
  }
  return parse_list_response(response.body);
}

bool S3ObjectStore::object_exists(const std::string& key) {
  Response response = perform("HEAD", object_uri(key), {}, "");
  if (response.status == 404) {
    return false;
  }
  if (response.status / 100 != 2) {
    raise_for("HEAD", key, response);
  }
  return true;
}

void S3ObjectStore::delete_object(const std::string& key) {
  Response response = perform("DELETE", object_uri(key), {}, "");
  if (response.status / 100 != 2) {
    raise_for("DELETE", key, response);
  }
  BOOST_LOG_TRIVIAL(debug) << "S3 store: Deleted " << key;
}


//==============================================
// RESPONSE PARSING
//==============================================

ListPage S3ObjectStore::parse_list_response(const std::string& xml) {
  ListPage page;
  try {
    boost::property_tree::ptree tree;
    std::istringstream in(xml);
    boost::property_tree::read_xml(in, tree);

    const auto& result = tree.get_child("ListBucketResult");
    for (const auto& [name, node] : result) {
      if (name != "Contents") {
        continue;
      }
      ObjectInfo info;
      info.key = node.get<std::string>("Key");
      info.size = node.get<std::uint64_t>("Size", 0);
      info.last_modified = parse_iso8601(node.get<std::string>("LastModified", ""));
      if (auto etag = node.get_optional<std::string>("ETag")) {
        info.etag = strip_quotes(*etag);
      }
      page.objects.push_back(std::move(info));
    }

    if (result.get<std::string>("IsTruncated", "false") == "true") {
      page.continuation_token = result.get<std::string>("NextContinuationToken", "");
      if (page.continuation_token.empty()) {
        throw StorageError(StorageErrorKind::OTHER, "Truncated listing without continuation token");
      }
    }
  }
  catch (const boost::property_tree::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "S3 store: Malformed listing response: " << e.what();
    throw StorageError(StorageErrorKind::OTHER, std::string("Malformed listing response: ") + e.what());
  }
  return page;
}

StorageErrorKind S3ObjectStore::classify_status(unsigned int status, const std::string& error_code) {
  if (status == 408 || status == 429 || status >= 500 ||
      error_code == "RequestTimeout" || error_code == "SlowDown" ||
      error_code == "InternalError" || error_code == "ServiceUnavailable") {
    return StorageErrorKind::TRANSIENT;
  }
  if (status == 403) {
    return StorageErrorKind::PERMISSION_DENIED;
  }
  if (status == 404) {
    return StorageErrorKind::NOT_FOUND;
  }
  if (error_code == "KeyTooLongError" || error_code == "InvalidObjectName" ||
      error_code == "InvalidBucketName") {
    return StorageErrorKind::INVALID_KEY;
  }
  return StorageErrorKind::OTHER;
}

std::chrono::system_clock::time_point S3ObjectStore::parse_iso8601(const std::string& text) {
  std::tm tm{};
  std::istringstream in(text);
  in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
  if (in.fail()) {
    throw StorageError(StorageErrorKind::OTHER, "Invalid timestamp in listing: '" + text + "'");
  }

  long millis = 0;
  if (in.peek() == '.') {
    in.get();
    std::string fraction;
    while (std::isdigit(in.peek())) {
      fraction += static_cast<char>(in.get());
    }
    fraction = (fraction + "000").substr(0, 3);
    millis = std::stol(fraction);
  }

  std::time_t seconds = timegm(&tm);
  return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds(millis);
}


//==============================================
// REQUEST EXECUTION
//==============================================

S3ObjectStore::Endpoint S3ObjectStore::parse_endpoint(const std::string& url) {
  Endpoint endpoint;
  std::string rest = url;

  if (rest.rfind("https://", 0) == 0) {
    endpoint.tls = true;
    rest = rest.substr(8);
  } else if (rest.rfind("http://", 0) == 0) {
    endpoint.tls = false;
    rest = rest.substr(7);
  }

  rest = rest.substr(0, rest.find('/'));
  auto colon = rest.find(':');
  if (colon != std::string::npos) {
    endpoint.host = rest.substr(0, colon);
    endpoint.port = rest.substr(colon + 1);
  } else {
    endpoint.host = rest;
    endpoint.port = endpoint.tls ? "443" : "80";
  }

  if (endpoint.host.empty()) {
    throw StorageError(StorageErrorKind::OTHER, "Invalid S3 endpoint: " + url);
  }
  return endpoint;
}

std::string S3ObjectStore::host_header() const {
  const bool default_port = (endpoint_.tls && endpoint_.port == "443") || (!endpoint_.tls && endpoint_.port == "80");
  return default_port ? endpoint_.host : endpoint_.host + ":" + endpoint_.port;
}

std::string S3ObjectStore::object_uri(const std::string& key) const {
  if (key.empty()) {
    throw StorageError(StorageErrorKind::INVALID_KEY, "Empty object key");
  }
  return "/" + S3Signer::uri_encode(bucket_, true) + "/" + S3Signer::uri_encode(key, false);
}

S3ObjectStore::Response S3ObjectStore::perform(const std::string& method,
                                               const std::string& canonical_uri,
                                               const std::map<std::string, std::string>& query,
                                               const std::string& body) const {
  std::map<std::string, std::string> headers{{"host", host_header()}};
  signer_.sign(method, canonical_uri, query, headers, crypto::sha256_hex(body),
               std::chrono::system_clock::now());

  std::string target = canonical_uri;
  const std::string query_string = S3Signer::canonical_query(query);
  if (!query_string.empty()) {
    target += "?" + query_string;
  }

  http::request<http::string_body> request{http::string_to_verb(method), target, 11};
  for (const auto& [name, value] : headers) {
    request.set(name, value);
  }
  request.set(http::field::user_agent, USER_AGENT);
  request.body() = body;
  request.prepare_payload();

  BOOST_LOG_TRIVIAL(trace) << "S3 store: " << method << " " << target;

  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    auto results = wait_for(ioc, resolver.async_resolve(endpoint_.host, endpoint_.port, net::use_future));

    std::pair<unsigned int, std::string> reply;
    if (endpoint_.tls) {
      beast::ssl_stream<beast::tcp_stream> stream(ioc, *ssl_context_);
      if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        throw beast::system_error(beast::error_code(static_cast<int>(::ERR_get_error()),
                                                    net::error::get_ssl_category()));
      }
      stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));

      beast::get_lowest_layer(stream).expires_after(options_.timeout);
      wait_for(ioc, beast::get_lowest_layer(stream).async_connect(results, net::use_future));
      beast::get_lowest_layer(stream).expires_after(options_.timeout);
      wait_for(ioc, stream.async_handshake(ssl::stream_base::client, net::use_future));

      reply = exchange(ioc, stream, request, options_.timeout);

      beast::error_code ec;
      stream.shutdown(ec);
      if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        BOOST_LOG_TRIVIAL(debug) << "S3 store: TLS shutdown: " << ec.message();
      }
    } else {
      beast::tcp_stream stream(ioc);
      stream.expires_after(options_.timeout);
      wait_for(ioc, stream.async_connect(results, net::use_future));

      reply = exchange(ioc, stream, request, options_.timeout);

      beast::error_code ec;
      stream.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        BOOST_LOG_TRIVIAL(debug) << "S3 store: Socket shutdown: " << ec.message();
      }
    }

    return Response{reply.first, std::move(reply.second)};
  }
  catch (const beast::system_error& e) {
    BOOST_LOG_TRIVIAL(warning) << "S3 store: " << method << " " << canonical_uri
                               << " network failure: " << e.code().message();
    throw StorageError(StorageErrorKind::TRANSIENT, method + " " + canonical_uri + ": " + e.code().message());
  }
}

void S3ObjectStore::raise_for(const std::string& operation, const std::string& target, const Response& response) const {
  const std::string code = parse_error_code(response.body);
  const StorageErrorKind kind = classify_status(response.status, code);

  std::stringstream message;
  message << operation << " " << target << " failed (HTTP " << response.status;
  if (!code.empty()) {
    message << ", " << code;
  }
  message << ")";

  const auto level = kind == StorageErrorKind::TRANSIENT
    ? boost::log::trivial::warning
    : boost::log::trivial::error;
  BOOST_LOG_SEV(boost::log::trivial::logger::get(), level) << "S3 store: " << message.str();
  throw StorageError(kind, message.str());
}

} // namespace storage
} // namespace bsync
