#pragma once

#include <asio/ip/tcp.hpp>
#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "linkdrop/error_codes.hpp"
#include "linkdrop/framing.hpp"
#include "linkdrop/protocol.hpp"
#include "linkdrop/server/access_control.hpp"
#include "linkdrop/server/clock.hpp"
#include "linkdrop/server/download_gate.hpp"
#include "linkdrop/server/progress_store.hpp"
#include "linkdrop/server/share_registry.hpp"
#include "linkdrop/server/share_storage.hpp"
#include "linkdrop/server/upload_pipeline.hpp"

namespace linkdrop::server
{

    struct ServerServices
    {
        ShareRegistry &registry;
        ShareStorage &storage;
        ProgressStore &progress;
        UploadPipeline &upload_pipeline;
        DownloadGate &download_gate;
        const AccessControl &access_control;
        const Clock &clock;
    };

    /**
     * One client connection. Handlers run on the socket's strand; outbound
     * frames are queued so that only one write is in flight at a time.
     */
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, ServerServices services);
        ~Session();

        void start();

        void stop();

    private:
        using WriteCallback = std::function<void()>;

        struct OutboundFrame
        {
            std::vector<std::uint8_t> bytes;
            WriteCallback on_written;
        };

        struct ActiveDownload
        {
            std::uint64_t id{};
            DownloadTicket ticket;
            std::optional<std::string> request_id;
            std::uint64_t offset{};
        };

        void read_frame_header();
        void read_frame_payload(std::size_t size);
        void process_message(const nlohmann::json &json);

        void send_response(const linkdrop::protocol::ResponseEnvelope &envelope, WriteCallback on_written = {});
        void send_error(linkdrop::ErrorCode code, std::string message,
                        std::optional<std::string> request_id = std::nullopt);
        void send_failure(const std::exception &ex, std::string_view operation,
                          const std::optional<std::string> &request_id);
        void write_next();

        bool require_authentication(const linkdrop::protocol::RequestEnvelope &envelope);

        void handle_authenticate(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_status(const linkdrop::protocol::RequestEnvelope &envelope);

        // Uploads
        void handle_upload_init(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_upload_chunk(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_upload_commit(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_upload_abort(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_upload_progress(const linkdrop::protocol::RequestEnvelope &envelope);

        // Share management
        void handle_list_shares(const linkdrop::protocol::RequestEnvelope &envelope);
        void handle_delete_share(const linkdrop::protocol::RequestEnvelope &envelope);

        // Downloads
        void handle_fetch_share(const linkdrop::protocol::RequestEnvelope &envelope);
        void stream_next_chunk(const std::shared_ptr<ActiveDownload> &download);

        void on_disconnect();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        ServerServices services_;

        std::array<std::uint8_t, linkdrop::protocol::kFrameHeaderSize> header_buffer_{};
        std::vector<std::uint8_t> buffer_;
        std::deque<OutboundFrame> outbound_;
        bool writing_{false};
        bool stopped_{false};
        bool authenticated_{false};

        std::unordered_map<std::string, std::unique_ptr<UploadSession>> uploads_;
        std::unordered_map<std::uint64_t, std::shared_ptr<ActiveDownload>> downloads_;
        std::uint64_t next_download_id_{1};
    };

} // namespace linkdrop::server
