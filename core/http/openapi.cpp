#include "openapi.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace waypoint {
namespace http {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string html_escape(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            case '\'':
                out += "&#39;";
                break;
            default:
                out += c;
        }
    }
    return out;
}

}  // namespace

nlohmann::ordered_json build_openapi_document(const Responder &responder, const runtime::ServiceConfig &service) {
    nlohmann::ordered_json doc = {{"openapi", "3.0.3"},
                                  {"info", {{"title", service.title}, {"version", service.version}}},
                                  {"paths", nlohmann::ordered_json::object()}};

    for (const auto &route : responder.routes()) {
        nlohmann::ordered_json response = {
            {"description", "Successful Response"},
            {"content", {{"application/json", {{"example", route.payload}}}}}};

        nlohmann::ordered_json operation = {{"summary", route.summary}, {"responses", {{"200", response}}}};

        doc["paths"][route.path][to_lower(route.method)] = operation;
    }

    return doc;
}

std::string render_docs_page(const Responder &responder, const runtime::ServiceConfig &service) {
    const std::string title = html_escape(service.title);

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n<meta charset=\"utf-8\">\n"
         << "<title>" << title << " - Docs</title>\n"
         << "</head>\n<body>\n"
         << "<h1>" << title << " <small>" << html_escape(service.version) << "</small></h1>\n"
         << "<p>OpenAPI document: <a href=\"" << kOpenApiPath << "\">" << kOpenApiPath << "</a></p>\n"
         << "<table>\n<tr><th>Method</th><th>Path</th><th>Summary</th><th>Example</th></tr>\n";

    for (const auto &route : responder.routes()) {
        html << "<tr><td>" << html_escape(route.method) << "</td>"
             << "<td><a href=\"" << html_escape(route.path) << "\">" << html_escape(route.path) << "</a></td>"
             << "<td>" << html_escape(route.summary) << "</td>"
             << "<td><code>" << html_escape(route.body) << "</code></td></tr>\n";
    }

    html << "</table>\n</body>\n</html>\n";
    return html.str();
}

}  // namespace http
}  // namespace waypoint
