#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <memory>
#include <thread>
#include <vector>

#include "linkdrop/server/access_control.hpp"
#include "linkdrop/server/cleanup_sweeper.hpp"
#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/config.hpp"
#include "linkdrop/server/download_gate.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"
#include "linkdrop/server/upload_pipeline.hpp"

namespace linkdrop::server
{

    class Session;

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void handle_signal();
        void run_sweep();
        void schedule_sweep();

        ServerConfig config_;

        // Sessions still queued in io_context_ reference these, so they are
        // declared first and destroyed last.
        SystemClock clock_;
        ShareStorage storage_;
        ShareRegistry registry_;
        ProgressStore progress_;
        UploadPipeline upload_pipeline_;
        DownloadGate download_gate_;
        CleanupSweeper sweeper_;
        AccessControl access_control_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        std::vector<std::thread> workers_;
    };

} // namespace linkdrop::server
