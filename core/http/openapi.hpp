#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "responder.hpp"
#include "runtime/config.hpp"

namespace waypoint {
namespace http {

/**
 * @brief API documentation generated from the route table
 *
 * The OpenAPI document holds one "get" operation per route, with the route's
 * payload as the 200 response example. The docs page is a plain HTML index
 * of the same routes that links to the OpenAPI document.
 */

constexpr const char *kOpenApiPath = "/openapi.json";
constexpr const char *kDocsPath = "/docs";

nlohmann::ordered_json build_openapi_document(const Responder &responder, const runtime::ServiceConfig &service);

std::string render_docs_page(const Responder &responder, const runtime::ServiceConfig &service);

}  // namespace http
}  // namespace waypoint
