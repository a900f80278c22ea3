#pragma once

#include <exception>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "../errors.hpp"

namespace waypoint
{
    namespace http
    {

        constexpr const char *kContentTypeJson = "application/json";
        constexpr const char *kContentTypeHtml = "text/html; charset=utf-8";

        // Helper: Send a pre-serialized JSON body
        inline void send_json(httplib::Response &res, StatusCode code, const std::string &body)
        {
            res.status = status_code_to_http(code);
            res.set_content(body, kContentTypeJson);
        }

        // Helper: Send JSON response
        inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body)
        {
            send_json(res, code, body.dump());
        }

        // Helper: Send the standard {"detail": ...} error body
        inline void send_error(httplib::Response &res, StatusCode code)
        {
            send_json(res, code, make_error_response(code));
        }

        // Fills the {"detail": ...} body for an httplib-raised error status,
        // leaving bodies set by handlers untouched
        void fill_error_body(const httplib::Request &req, httplib::Response &res);

        // Logs the exception at ERROR and answers 500
        void handle_exception(const httplib::Request &req, httplib::Response &res, std::exception_ptr ep);

        // One DEBUG line per request: "[HTTP] GET /api -> 200"
        void log_request(const httplib::Request &req, const httplib::Response &res);

    } // namespace http
} // namespace waypoint
