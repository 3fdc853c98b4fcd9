#include "linkdrop/protocol.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>

namespace linkdrop::protocol
{

    namespace
    {

        struct CommandMapping
        {
            Command command;
            std::string_view label;
        };

        constexpr std::array<CommandMapping, 11> kCommandMappings{{
            {Command::Authenticate, "AUTHENTICATE"},
            {Command::Status, "STATUS"},
            {Command::UploadInit, "UPLOAD_INIT"},
            {Command::UploadChunk, "UPLOAD_CHUNK"},
            {Command::UploadCommit, "UPLOAD_COMMIT"},
            {Command::UploadAbort, "UPLOAD_ABORT"},
            {Command::UploadProgress, "UPLOAD_PROGRESS"},
            {Command::ListShares, "LIST_SHARES"},
            {Command::DeleteShare, "DELETE_SHARE"},
            {Command::FetchShare, "FETCH_SHARE"},
            {Command::Ping, "PING"},
        }};

        struct ResponseKindMapping
        {
            ResponseKind kind;
            std::string_view label;
        };

        constexpr std::array<ResponseKindMapping, 3> kResponseMappings{{
            {ResponseKind::Ok, "OK"},
            {ResponseKind::Error, "ERROR"},
            {ResponseKind::Continue, "CONTINUE"},
        }};

        template <typename T>
        std::optional<T> optional_field(const nlohmann::json &json, const char *key)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                return it->get<T>();
            }
            return std::nullopt;
        }

        // Reads an unsigned count without letting nlohmann narrow it: negative,
        // fractional and oversized numbers are rejected instead of wrapped.
        template <typename T>
        std::optional<T> optional_count(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return std::nullopt;
            }
            if (!it->is_number_integer())
            {
                throw PayloadError(std::string(key) + " must be an integer");
            }
            if (it->is_number_unsigned())
            {
                const auto value = it->get<std::uint64_t>();
                if (value <= std::numeric_limits<T>::max())
                {
                    return static_cast<T>(value);
                }
            }
            else if (const auto value = it->get<std::int64_t>();
                     value >= 0 && static_cast<std::uint64_t>(value) <= std::numeric_limits<T>::max())
            {
                return static_cast<T>(value);
            }
            throw PayloadError(std::string(key) + " is out of range");
        }

        template <typename T>
        void put_optional(nlohmann::json &json, const char *key, const std::optional<T> &value)
        {
            if (value)
            {
                json[key] = *value;
            }
            else
            {
                json[key] = nullptr;
            }
        }

        std::optional<std::string> read_request_id(const nlohmann::json &json)
        {
            if (auto it = json.find("id"); it != json.end())
            {
                return it->get<std::string>();
            }
            return std::nullopt;
        }

    } // namespace

    std::string_view to_string(Command command) noexcept
    {
        for (const auto &mapping : kCommandMappings)
        {
            if (mapping.command == command)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<Command> command_from_string(std::string_view value) noexcept
    {
        const auto it = std::find_if(kCommandMappings.begin(), kCommandMappings.end(),
                                     [value](const CommandMapping &mapping)
                                     { return mapping.label == value; });
        if (it == kCommandMappings.end())
        {
            return std::nullopt;
        }
        return it->command;
    }

    std::string_view to_string(ResponseKind kind) noexcept
    {
        for (const auto &mapping : kResponseMappings)
        {
            if (mapping.kind == kind)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    std::optional<ResponseKind> response_kind_from_string(std::string_view value) noexcept
    {
        const auto it = std::find_if(kResponseMappings.begin(), kResponseMappings.end(),
                                     [value](const ResponseKindMapping &mapping)
                                     { return mapping.label == value; });
        if (it == kResponseMappings.end())
        {
            return std::nullopt;
        }
        return it->kind;
    }

    void to_json(nlohmann::json &json, const RequestEnvelope &envelope)
    {
        json = {
            {"cmd", to_string(envelope.command)},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, RequestEnvelope &envelope)
    {
        const auto cmd_label = json.at("cmd").get<std::string>();
        auto cmd = command_from_string(cmd_label);
        if (!cmd)
        {
            throw std::runtime_error("Unknown command: " + cmd_label);
        }
        envelope.command = *cmd;
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_request_id(json);
    }

    void to_json(nlohmann::json &json, const ResponseEnvelope &envelope)
    {
        json = {
            {"status", to_string(envelope.kind)},
            {"error", to_int(envelope.error)},
            {"message", envelope.message},
            {"payload", envelope.payload},
        };
        if (envelope.request_id)
        {
            json["id"] = *envelope.request_id;
        }
    }

    void from_json(const nlohmann::json &json, ResponseEnvelope &envelope)
    {
        const auto status_label = json.at("status").get<std::string>();
        auto kind = response_kind_from_string(status_label);
        if (!kind)
        {
            throw std::runtime_error("Unknown response status: " + status_label);
        }
        envelope.kind = *kind;
        const auto error_value = json.value("error", 0u);
        envelope.error = error_code_from_int(static_cast<std::uint16_t>(error_value));
        envelope.message = json.value("message", std::string{});
        envelope.payload = json.value("payload", nlohmann::json::object());
        envelope.request_id = read_request_id(json);
    }

    void to_json(nlohmann::json &json, const AuthenticateRequest &request)
    {
        json = {{"key", request.key}};
    }

    void from_json(const nlohmann::json &json, AuthenticateRequest &request)
    {
        request.key = json.value("key", std::string{});
    }

    void to_json(nlohmann::json &json, const StatusResponse &response)
    {
        json = {
            {"authenticated", response.authenticated},
            {"version", response.version},
            {"max_upload_size", response.max_upload_size},
        };
    }

    void from_json(const nlohmann::json &json, StatusResponse &response)
    {
        response.authenticated = json.value("authenticated", false);
        response.version = json.value("version", std::string{});
        response.max_upload_size = json.value("max_upload_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadInitRequest &request)
    {
        json = {
            {"filename", request.filename},
            {"expiration_days", request.expiration_days},
        };
        put_optional(json, "size", request.declared_size);
        put_optional(json, "max_downloads", request.max_downloads);
    }

    void from_json(const nlohmann::json &json, UploadInitRequest &request)
    {
        request.filename = json.at("filename").get<std::string>();
        request.declared_size = optional_count<std::uint64_t>(json, "size");
        request.max_downloads = optional_count<std::uint32_t>(json, "max_downloads");
        request.expiration_days = optional_count<std::uint32_t>(json, "expiration_days").value_or(1u);
    }

    void to_json(nlohmann::json &json, const UploadInitResponse &response)
    {
        json = {
            {"upload_id", response.upload_id},
            {"chunk_size", response.chunk_size},
            {"max_size", response.max_size},
        };
    }

    void from_json(const nlohmann::json &json, UploadInitResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.chunk_size = json.value("chunk_size", 0ULL);
        response.max_size = json.value("max_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const UploadChunkRequest &request)
    {
        json = {
            {"upload_id", request.upload_id},
            {"data", request.data_base64},
        };
        if (request.chunk_hash)
        {
            json["hash"] = *request.chunk_hash;
        }
    }

    void from_json(const nlohmann::json &json, UploadChunkRequest &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
        request.data_base64 = json.value("data", std::string{});
        request.chunk_hash = optional_field<std::string>(json, "hash");
    }

    void to_json(nlohmann::json &json, const UploadRef &request)
    {
        json = {{"upload_id", request.upload_id}};
    }

    void from_json(const nlohmann::json &json, UploadRef &request)
    {
        request.upload_id = json.at("upload_id").get<std::string>();
    }

    void to_json(nlohmann::json &json, const ShareCreated &response)
    {
        json = {
            {"token", response.token},
            {"expires_at", response.expires_at},
        };
        put_optional(json, "max_downloads", response.max_downloads);
    }

    void from_json(const nlohmann::json &json, ShareCreated &response)
    {
        response.token = json.at("token").get<std::string>();
        response.expires_at = json.value("expires_at", std::string{});
        response.max_downloads = optional_field<std::uint32_t>(json, "max_downloads");
    }

    void to_json(nlohmann::json &json, const UploadProgressResponse &response)
    {
        json = {
            {"total", response.total},
            {"uploaded", response.uploaded},
            {"status", response.status},
        };
    }

    void from_json(const nlohmann::json &json, UploadProgressResponse &response)
    {
        response.total = json.value("total", 0ULL);
        response.uploaded = json.value("uploaded", 0ULL);
        response.status = json.value("status", std::string{});
    }

    void to_json(nlohmann::json &json, const ShareSummary &summary)
    {
        json = {
            {"id", summary.id},
            {"filename", summary.filename},
            {"share_id", summary.token},
            {"expires_at", summary.expires_at},
            {"download_count", summary.download_count},
            {"created_at", summary.created_at},
        };
        put_optional(json, "max_downloads", summary.max_downloads);
    }

    void from_json(const nlohmann::json &json, ShareSummary &summary)
    {
        summary.id = json.at("id").get<std::int64_t>();
        summary.filename = json.value("filename", std::string{});
        summary.token = json.at("share_id").get<std::string>();
        summary.expires_at = json.value("expires_at", std::string{});
        summary.max_downloads = optional_field<std::uint32_t>(json, "max_downloads");
        summary.download_count = json.value("download_count", 0u);
        summary.created_at = json.value("created_at", std::string{});
    }

    void to_json(nlohmann::json &json, const DeleteShareRequest &request)
    {
        json = {{"id", request.id}};
    }

    void from_json(const nlohmann::json &json, DeleteShareRequest &request)
    {
        request.id = json.at("id").get<std::int64_t>();
    }

    void to_json(nlohmann::json &json, const FetchShareRequest &request)
    {
        json = {{"token", request.token}};
    }

    void from_json(const nlohmann::json &json, FetchShareRequest &request)
    {
        request.token = json.at("token").get<std::string>();
    }

    void to_json(nlohmann::json &json, const FetchShareResponse &response)
    {
        json = {
            {"filename", response.filename},
            {"size", response.size},
            {"chunk_size", response.chunk_size},
        };
    }

    void from_json(const nlohmann::json &json, FetchShareResponse &response)
    {
        response.filename = json.value("filename", std::string{});
        response.size = json.value("size", 0ULL);
        response.chunk_size = json.value("chunk_size", 0ULL);
    }

    void to_json(nlohmann::json &json, const ShareDataChunk &chunk)
    {
        json = {
            {"offset", chunk.offset},
            {"data", chunk.data_base64},
            {"hash", chunk.chunk_hash},
            {"done", chunk.done},
        };
    }

    void from_json(const nlohmann::json &json, ShareDataChunk &chunk)
    {
        chunk.offset = json.value("offset", 0ULL);
        chunk.data_base64 = json.value("data", std::string{});
        chunk.chunk_hash = json.value("hash", std::string{});
        chunk.done = json.value("done", false);
    }

} // namespace linkdrop::protocol
