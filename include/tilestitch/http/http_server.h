#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "tilestitch/core/config.h"
#include "tilestitch/http/router.h"
#include "tilestitch/reassembly/sweeper.h"
#include "tilestitch/storage/local_object_store.h"

namespace tilestitch::http {

/// @brief HTTP server bootstrapper (acceptor, TLS context, sweep timer).
///
/// Signed object downloads are served by the connection itself so that files stream from
/// disk; everything else goes through the router.
class HttpServer {
public:
    HttpServer(boost::asio::io_context& ioc, const core::Config& config, Router router,
               std::shared_ptr<storage::LocalObjectStore> objects,
               std::shared_ptr<reassembly::Sweeper> sweeper);
    void Run();

private:
    void StartSweepJob();
    void ScheduleSweep();
    void RunSweep();

    boost::asio::io_context& ioc_;
    core::Config config_;
    Router router_;
    std::shared_ptr<storage::LocalObjectStore> objects_;
    std::shared_ptr<reassembly::Sweeper> sweeper_;
    std::unique_ptr<boost::asio::ssl::context> ssl_context_;
    std::unique_ptr<boost::asio::steady_timer> sweep_timer_;
};

}  // namespace tilestitch::http
