/**
 * LinkDrop - Shared protocol schema and serialization helpers.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "linkdrop/error_codes.hpp"

namespace linkdrop::protocol
{

    enum class Command : std::uint8_t
    {
        Authenticate,
        Status,
        UploadInit,
        UploadChunk,
        UploadCommit,
        UploadAbort,
        UploadProgress,
        ListShares,
        DeleteShare,
        FetchShare,
        Ping
    };

    std::string_view to_string(Command command) noexcept;
    std::optional<Command> command_from_string(std::string_view value) noexcept;

    enum class ResponseKind : std::uint8_t
    {
        Ok = 0,
        Error = 1,
        Continue = 2
    };

    std::string_view to_string(ResponseKind kind) noexcept;
    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept;

    // A payload field has the right JSON shape but a value its type cannot hold.
    class PayloadError : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };

    struct RequestEnvelope
    {
        Command command{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope);
    void from_json(const nlohmann::json &json, RequestEnvelope &envelope);

    struct ResponseEnvelope
    {
        ResponseKind kind{ResponseKind::Ok};
        ErrorCode error{ErrorCode::Ok};
        std::string message{};
        nlohmann::json payload{nlohmann::json::object()};
        std::optional<std::string> request_id{};
    };

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope);
    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope);

    struct AuthenticateRequest
    {
        std::string key{};
    };

    void to_json(nlohmann::json &json, const AuthenticateRequest &request);
    void from_json(const nlohmann::json &json, AuthenticateRequest &request);

    struct StatusResponse
    {
        bool authenticated{};
        std::string version{};
        std::uint64_t max_upload_size{};
    };

    void to_json(nlohmann::json &json, const StatusResponse &response);
    void from_json(const nlohmann::json &json, StatusResponse &response);

    struct UploadInitRequest
    {
        std::string filename;
        std::optional<std::uint64_t> declared_size{};
        std::optional<std::uint32_t> max_downloads{};
        std::uint32_t expiration_days{1};
    };

    void to_json(nlohmann::json &json, const UploadInitRequest &request);
    void from_json(const nlohmann::json &json, UploadInitRequest &request);

    struct UploadInitResponse
    {
        std::string upload_id;
        std::uint64_t chunk_size{};
        std::uint64_t max_size{};
    };

    void to_json(nlohmann::json &json, const UploadInitResponse &response);
    void from_json(const nlohmann::json &json, UploadInitResponse &response);

    struct UploadChunkRequest
    {
        std::string upload_id;
        std::string data_base64;
        std::optional<std::string> chunk_hash{};
    };

    void to_json(nlohmann::json &json, const UploadChunkRequest &request);
    void from_json(const nlohmann::json &json, UploadChunkRequest &request);

    // Used by UPLOAD_COMMIT, UPLOAD_ABORT and UPLOAD_PROGRESS.
    struct UploadRef
    {
        std::string upload_id;
    };

    void to_json(nlohmann::json &json, const UploadRef &request);
    void from_json(const nlohmann::json &json, UploadRef &request);

    struct ShareCreated
    {
        std::string token;
        std::string expires_at;
        std::optional<std::uint32_t> max_downloads{};
    };

    void to_json(nlohmann::json &json, const ShareCreated &response);
    void from_json(const nlohmann::json &json, ShareCreated &response);

    struct UploadProgressResponse
    {
        std::uint64_t total{};
        std::uint64_t uploaded{};
        std::string status;
    };

    void to_json(nlohmann::json &json, const UploadProgressResponse &response);
    void from_json(const nlohmann::json &json, UploadProgressResponse &response);

    struct ShareSummary
    {
        std::int64_t id{};
        std::string filename;
        std::string token;
        std::string expires_at;
        std::optional<std::uint32_t> max_downloads{};
        std::uint32_t download_count{};
        std::string created_at;
    };

    void to_json(nlohmann::json &json, const ShareSummary &summary);
    void from_json(const nlohmann::json &json, ShareSummary &summary);

    struct DeleteShareRequest
    {
        std::int64_t id{};
    };

    void to_json(nlohmann::json &json, const DeleteShareRequest &request);
    void from_json(const nlohmann::json &json, DeleteShareRequest &request);

    struct FetchShareRequest
    {
        std::string token;
    };

    void to_json(nlohmann::json &json, const FetchShareRequest &request);
    void from_json(const nlohmann::json &json, FetchShareRequest &request);

    struct FetchShareResponse
    {
        std::string filename;
        std::uint64_t size{};
        std::uint64_t chunk_size{};
    };

    void to_json(nlohmann::json &json, const FetchShareResponse &response);
    void from_json(const nlohmann::json &json, FetchShareResponse &response);

    // Payload of the CONTINUE frames that carry a share's bytes.
    struct ShareDataChunk
    {
        std::uint64_t offset{};
        std::string data_base64;
        std::string chunk_hash;
        bool done{};
    };

    void to_json(nlohmann::json &json, const ShareDataChunk &chunk);
    void from_json(const nlohmann::json &json, ShareDataChunk &chunk);

} // namespace linkdrop::protocol
