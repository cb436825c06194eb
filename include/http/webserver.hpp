#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <atomic>
#include <chrono>
#include <future>
#include <list>
#include <memory>

#include "socketwrapper.hpp"

#include "http/request_handler.hpp"

namespace http
{

#define WEBSERVER_READ_BUFFER 8192
#define WEBSERVER_ACCEPT_BACKOFF_MS 100
#define WEBSERVER_REJECT_WAIT_MS 100

struct webserver_options
{
    size_t max_connections = 64;
    std::chrono::seconds io_timeout {5};
};

/// Serves the device descriptor, one task per accepted connection
class webserver
{
public:
    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = default;
    webserver& operator=(webserver&&) = default;
    ~webserver();

    /// Throws std::runtime_error if the port can not be bound
    webserver(uint16_t port, request_handler handler, webserver_options options = {});

    void serve(std::atomic<bool>& run_condition);

    /// Port the acceptor is bound to, useful when constructed with port 0
    uint16_t port() const;

private:

    void reap_finished();

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    request_handler m_handler;

    webserver_options m_options;

    std::shared_ptr<std::atomic<size_t>> m_active;

    std::list<std::future<void>> m_tasks;

};

} // namespace http

#endif
