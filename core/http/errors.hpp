#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "relay/relay_error.hpp"

namespace hpipe
{
    namespace http
    {

        /**
         * @brief Relay status codes mapped to HTTP status codes
         *
         * Relay failures keep the names of relay::RelayError so that clients can map
         * an error envelope straight back onto the taxonomy:
         * - OK -> HTTP 200
         * - INVALID_ARGUMENT -> HTTP 400
         * - NOT_FOUND -> HTTP 404
         * - ROLE_CONFLICT, RESUME_OFFSET_MISMATCH -> HTTP 409
         * - OFFSET_TOO_OLD, UPSTREAM_GONE -> HTTP 410
         * - UNAVAILABLE -> HTTP 503
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            INVALID_ARGUMENT,
            NOT_FOUND,
            ROLE_CONFLICT,
            RESUME_OFFSET_MISMATCH,
            OFFSET_TOO_OLD,
            UPSTREAM_GONE,
            UNAVAILABLE,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::INVALID_ARGUMENT:
                return 400;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::ROLE_CONFLICT:
            case StatusCode::RESUME_OFFSET_MISMATCH:
                return 409;
            case StatusCode::OFFSET_TOO_OLD:
            case StatusCode::UPSTREAM_GONE:
                return 410;
            case StatusCode::UNAVAILABLE:
                return 503;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Convert StatusCode to string representation
         */
        inline std::string status_code_to_string(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::INVALID_ARGUMENT:
                return "INVALID_ARGUMENT";
            case StatusCode::NOT_FOUND:
                return "NOT_FOUND";
            case StatusCode::ROLE_CONFLICT:
                return "ROLE_CONFLICT";
            case StatusCode::RESUME_OFFSET_MISMATCH:
                return "RESUME_OFFSET_MISMATCH";
            case StatusCode::OFFSET_TOO_OLD:
                return "OFFSET_TOO_OLD";
            case StatusCode::UPSTREAM_GONE:
                return "UPSTREAM_GONE";
            case StatusCode::UNAVAILABLE:
                return "UNAVAILABLE";
            case StatusCode::INTERNAL:
                return "INTERNAL";
            default:
                return "INTERNAL";
            }
        }

        /**
         * @brief Map a relay failure onto the status reported to the client
         *
         * Protocol violations get their own codes. STALLED (a segment ended on a
         * full window) and CANCELLED are transient and map onto a retryable 503.
         */
        inline StatusCode status_for(relay::RelayError error)
        {
            switch (error)
            {
            case relay::RelayError::NONE:
                return StatusCode::OK;
            case relay::RelayError::ROLE_CONFLICT:
                return StatusCode::ROLE_CONFLICT;
            case relay::RelayError::RESUME_OFFSET_MISMATCH:
                return StatusCode::RESUME_OFFSET_MISMATCH;
            case relay::RelayError::OFFSET_TOO_OLD:
                return StatusCode::OFFSET_TOO_OLD;
            case relay::RelayError::UPSTREAM_GONE:
                return StatusCode::UPSTREAM_GONE;
            case relay::RelayError::STALLED:
            case relay::RelayError::CANCELLED:
                return StatusCode::UNAVAILABLE;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a JSON status object
         *
         * All JSON responses include a top-level "status" object with code and message.
         */
        inline nlohmann::json make_status(StatusCode code, const std::string &message = "")
        {
            std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
            return {
                {"code", status_code_to_string(code)},
                {"message", msg}};
        }

        /**
         * @brief Build a complete JSON error response
         */
        inline nlohmann::json make_error_response(StatusCode code, const std::string &message)
        {
            return {
                {"status", make_status(code, message)}};
        }

    } // namespace http
} // namespace hpipe
