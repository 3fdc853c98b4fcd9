#include "linkdrop/server/session.hpp"

#include <algorithm>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "linkdrop/crypto.hpp"
#include "linkdrop/encoding/base64.hpp"
#include "linkdrop/server/share_error.hpp"
#include "linkdrop/server/upload_pipeline.hpp"
#include "session_common.hpp"

namespace linkdrop::server
{

    // Share links are bearer capabilities: fetching needs the token only.
    void Session::handle_fetch_share(const linkdrop::protocol::RequestEnvelope &envelope)
    {
        try
        {
            const auto request = envelope.payload.get<linkdrop::protocol::FetchShareRequest>();
            auto ticket = services_.download_gate.open(request.token);

            const linkdrop::protocol::FetchShareResponse header{
                .filename = ticket.record().filename,
                .size = ticket.size(),
                .chunk_size = kUploadChunkSize,
            };
            spdlog::info("{} downloading share {} ({} bytes)", remote_endpoint(), ticket.record().token,
                         ticket.size());

            const auto id = next_download_id_++;
            auto download = std::make_shared<ActiveDownload>(ActiveDownload{
                .id = id,
                .ticket = std::move(ticket),
                .request_id = envelope.request_id,
                .offset = 0,
            });
            downloads_.emplace(id, download);

            send_response(session_common::make_ok_response(header, envelope.request_id),
                          [this, download]
                          { stream_next_chunk(download); });
        }
        catch (const std::exception &ex)
        {
            send_failure(ex, "fetch share", envelope.request_id);
        }
    }

    void Session::stream_next_chunk(const std::shared_ptr<ActiveDownload> &download)
    {
        if (stopped_)
        {
            return;
        }
        auto &ticket = download->ticket;
        const auto remaining = ticket.size() - std::min(download->offset, ticket.size());
        std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kUploadChunkSize)));

        if (!buffer.empty())
        {
            ticket.stream().read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            if (static_cast<std::size_t>(ticket.stream().gcount()) != buffer.size())
            {
                spdlog::error("Short read while streaming share {}", ticket.record().token);
                downloads_.erase(download->id);
                send_error(linkdrop::ErrorCode::InternalError, "Internal error", download->request_id);
                return;
            }
        }

        const bool done = download->offset + buffer.size() >= ticket.size();
        const linkdrop::protocol::ShareDataChunk chunk{
            .offset = download->offset,
            .data_base64 = linkdrop::encoding::encode_base64(buffer),
            .chunk_hash = linkdrop::crypto::hash_bytes(buffer),
            .done = done,
        };
        download->offset += buffer.size();

        send_response(session_common::make_continue_response(chunk, download->request_id),
                      [this, download, done]
                      {
                          if (!done)
                          {
                              stream_next_chunk(download);
                              return;
                          }
                          // Deferred deletion of an exhausted share happens here,
                          // after the last byte has left.
                          download->ticket.complete();
                          downloads_.erase(download->id);
                          spdlog::debug("Finished streaming share {}", download->ticket.record().token);
                      });
    }

} // namespace linkdrop::server
