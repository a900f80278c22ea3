#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace waypoint
{
    namespace http
    {

        /**
         * @brief Response status codes used by the HTTP layer
         *
         * - OK -> HTTP 200
         * - NOT_FOUND -> HTTP 404
         * - METHOD_NOT_ALLOWED -> HTTP 405
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            NOT_FOUND,
            METHOD_NOT_ALLOWED,
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
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::METHOD_NOT_ALLOWED:
                return 405;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Standard reason phrase for a StatusCode
         */
        inline std::string status_code_to_reason(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return "OK";
            case StatusCode::NOT_FOUND:
                return "Not Found";
            case StatusCode::METHOD_NOT_ALLOWED:
                return "Method Not Allowed";
            case StatusCode::INTERNAL:
                return "Internal Server Error";
            default:
                return "Internal Server Error";
            }
        }

        /**
         * @brief Build a JSON error body
         *
         * Error bodies carry a single "detail" field holding the reason
         * phrase, e.g. {"detail":"Not Found"}.
         */
        inline nlohmann::json make_error_response(StatusCode code)
        {
            return {{"detail", status_code_to_reason(code)}};
        }

    } // namespace http
} // namespace waypoint
