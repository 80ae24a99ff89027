#include "description_fetcher.h"
#include "device.h"
#include "logger.h"
#include "ssdp_codec.h"
#include "string_utils.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <memory>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace tvlink {

namespace {

// One GET on a private io_context; everything is bounded by run_for().
struct FetchOperation : std::enable_shared_from_this<FetchOperation> {
    FetchOperation(net::io_context& ioc, HttpUrl url)
        : resolver(ioc), stream(ioc), url(std::move(url)) {}

    void start() {
        request.version(11);
        request.method(http::verb::get);
        request.target(url.target);
        request.set(http::field::host, url.host + ":" + std::to_string(url.port));
        request.set(http::field::user_agent, "tvlink/1.0 UPnP/1.1");
        request.set(http::field::cache_control, "no-cache");

        auto self = shared_from_this();
        resolver.async_resolve(url.host, std::to_string(url.port),
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) return self->finish(ec);
                self->stream.async_connect(results,
                    [self](beast::error_code ec, const tcp::endpoint&) {
                        if (ec) return self->finish(ec);
                        http::async_write(self->stream, self->request,
                            [self](beast::error_code ec, std::size_t) {
                                if (ec) return self->finish(ec);
                                http::async_read(self->stream, self->buffer, self->response,
                                    [self](beast::error_code ec, std::size_t) { self->finish(ec); });
                            });
                    });
            });
    }

    void finish(beast::error_code ec) {
        error = ec;
        done = true;
        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    }

    tcp::resolver resolver;
    beast::tcp_stream stream;
    HttpUrl url;
    http::request<http::empty_body> request;
    beast::flat_buffer buffer;
    http::response<http::string_body> response;
    beast::error_code error;
    bool done = false;
};

} // namespace

std::optional<std::string> xml_tag(const std::string& tag, const std::string& xml) {
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const auto start = xml.find(open);
    if (start == std::string::npos) {
        return std::nullopt;
    }
    const auto begin = start + open.size();
    const auto end = xml.find(close, begin);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    std::string value = trim(xml.substr(begin, end - begin));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<DeviceDescription> parse_device_description(const std::string& xml) {
    DeviceDescription description;
    description.manufacturer = xml_tag("manufacturer", xml).value_or("LG");
    if (!contains_ci(description.manufacturer, "lg")) {
        return std::nullopt;
    }
    description.friendly_name = xml_tag("friendlyName", xml).value_or(kGenericDeviceName);
    description.model = xml_tag("modelName", xml);
    return description;
}

std::optional<std::string> DescriptionFetcher::fetch(const std::string& url,
                                                     std::chrono::milliseconds timeout) const {
    auto parsed = parse_http_url(url);
    if (!parsed) {
        LOG_DEBUG("[Discovery] Ignoring non-HTTP description URL " + url);
        return std::nullopt;
    }

    net::io_context ioc;
    auto op = std::make_shared<FetchOperation>(ioc, *parsed);
    op->start();
    ioc.run_for(timeout);

    if (!op->done) {
        op->resolver.cancel();
        op->stream.cancel();
        beast::error_code ignored;
        op->stream.socket().close(ignored);
        ioc.restart();
        ioc.run();
        LOG_DEBUG("[Discovery] Description fetch timed out: " + url);
        return std::nullopt;
    }
    if (op->error) {
        LOG_DEBUG("[Discovery] Description fetch failed: " + url + " (" + op->error.message() + ")");
        return std::nullopt;
    }
    const unsigned status = op->response.result_int();
    if (status < 200 || status >= 300) {
        LOG_DEBUG("[Discovery] Description fetch returned " + std::to_string(status) + ": " + url);
        return std::nullopt;
    }
    return op->response.body();
}

} // namespace tvlink
