#include "http/webserver.hpp"
#include "logging.hpp"

#include <array>
#include <memory>
#include <string>
#include <thread>
#include <poll.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>

namespace http
{

using connection = net::tcp_connection<net::ip_version::v4>;

static void set_timeouts(const connection& conn, std::chrono::seconds timeout)
{
    timeval tv {};
    tv.tv_sec = timeout.count();
    if(setsockopt(conn.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        setsockopt(conn.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        logging::warn("Failed to set connection timeouts");
}

static void send_response(connection& conn, const response& res)
{
    std::string res_str = res.to_string();
    conn.send(net::span {res_str.begin(), res_str.end()});
}

/// Consumes a pending request so closing the socket does not reset the connection
static void discard_request(connection& conn)
{
    pollfd pfd {conn.get(), POLLIN, 0};
    if(poll(&pfd, 1, WEBSERVER_REJECT_WAIT_MS) <= 0 || !(pfd.revents & POLLIN))
        return;

    std::array<char, WEBSERVER_READ_BUFFER> buffer;
    conn.read(net::span {buffer.data(), buffer.size()});
}

static void serve_connection(connection&& conn, const request_handler& handler, std::chrono::seconds timeout)
{
    set_timeouts(conn, timeout);

    // Requests of the discovering clients are small and arrive in one piece
    std::array<char, WEBSERVER_READ_BUFFER> buffer;
    size_t br = conn.read(net::span {buffer.data(), buffer.size()});
    if(br == 0)
        return;

    send_response(conn, handler.handle(std::string_view {buffer.data(), br}));
}

webserver::webserver(uint16_t port, request_handler handler, webserver_options options)
    : m_acceptor {"0.0.0.0", port},
      m_handler {std::move(handler)},
      m_options {options},
      m_active {std::make_shared<std::atomic<size_t>>(0)}
{}

uint16_t webserver::port() const
{
    sockaddr_in addr {};
    socklen_t len = sizeof(addr);
    if(getsockname(m_acceptor.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0)
        throw std::runtime_error {"Unable to get webserver port"};
    return ntohs(addr.sin_port);
}

webserver::~webserver()
{
    for(auto& task : m_tasks)
    {
        if(task.valid())
            task.wait();
    }
}

void webserver::reap_finished()
{
    for(auto it = m_tasks.begin(); it != m_tasks.end(); )
    {
        if(it->wait_for(std::chrono::seconds {0}) == std::future_status::ready)
            it = m_tasks.erase(it);
        else
            ++it;
    }
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    logging::info("Webserver serving ...");
    while(run_condition.load())
    {
        std::unique_ptr<connection> conn;
        try {
            conn = std::make_unique<connection>(m_acceptor.accept());
        } catch(std::runtime_error& e) {
            if(run_condition.load())
            {
                // Errors like EMFILE persist for a while, do not spin on them
                logging::warn("Failed to accept connection: {}", e.what());
                std::this_thread::sleep_for(std::chrono::milliseconds {WEBSERVER_ACCEPT_BACKOFF_MS});
            }
            continue;
        }

        reap_finished();
        if(!run_condition.load())
            break;

        if(m_active->load() >= m_options.max_connections)
        {
            response busy;
            busy.set_code(503);
            busy.set_header("Connection", "close");
            try {
                discard_request(*conn);
                send_response(*conn, busy);
            } catch(std::runtime_error& e) {
                logging::debug("Failed to reject connection: {}", e.what());
            }
            continue;
        }

        m_active->fetch_add(1);
        m_tasks.push_back(std::async(std::launch::async,
            [conn = std::move(conn), handler = m_handler, active = m_active, timeout = m_options.io_timeout]() mutable
        {
            try {
                serve_connection(std::move(*conn), handler, timeout);
            } catch(std::exception& e) {
                logging::warn("Connection failed: {}", e.what());
            }
            conn.reset();
            active->fetch_sub(1);
        }));
    }

    logging::info("Webserver closing");
}

} // namespace http
