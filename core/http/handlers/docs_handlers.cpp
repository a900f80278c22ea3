#include "../openapi.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace waypoint {
namespace http {

//=============================================================================
// GET /openapi.json
//=============================================================================
void HttpServer::handle_get_openapi(const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, openapi_body_);
}

//=============================================================================
// GET /docs
//=============================================================================
void HttpServer::handle_get_docs(const httplib::Request &, httplib::Response &res) {
    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(docs_page_, kContentTypeHtml);
}

void HttpServer::handle_docs_method_not_allowed(const httplib::Request &, httplib::Response &res) {
    send_method_not_allowed(res, {"GET", "HEAD"});
}

}  // namespace http
}  // namespace waypoint
