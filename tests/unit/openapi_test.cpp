#include "http/openapi.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace waypoint;
using namespace waypoint::http;

class OpenApiTest : public ::testing::Test {
protected:
    Responder responder;
    runtime::ServiceConfig service;
};

TEST_F(OpenApiTest, DocumentHeader) {
    service.title = "Test Service";
    service.version = "9.9.9";

    auto doc = build_openapi_document(responder, service);

    EXPECT_EQ(doc["openapi"], "3.0.3");
    EXPECT_EQ(doc["info"]["title"], "Test Service");
    EXPECT_EQ(doc["info"]["version"], "9.9.9");
}

TEST_F(OpenApiTest, ListsEveryRouteAsGetOperation) {
    auto doc = build_openapi_document(responder, service);
    const auto &paths = doc["paths"];

    ASSERT_EQ(paths.size(), 3u);
    for (const auto &route : responder.routes()) {
        ASSERT_TRUE(paths.contains(route.path)) << route.path;
        ASSERT_TRUE(paths[route.path].contains("get")) << route.path;
        EXPECT_EQ(paths[route.path]["get"]["summary"], route.summary);
    }
}

TEST_F(OpenApiTest, ResponseExampleIsRoutePayload) {
    auto doc = build_openapi_document(responder, service);

    const auto &example = doc["paths"]["/api/health"]["get"]["responses"]["200"]["content"]["application/json"]["example"];
    EXPECT_EQ(example.dump(), R"({"status":"healthy"})");
}

TEST_F(OpenApiTest, DocsPageLinksDocumentAndRoutes) {
    std::string page = render_docs_page(responder, service);

    EXPECT_NE(page.find("<!DOCTYPE html>"), std::string::npos);
    EXPECT_NE(page.find("href=\"/openapi.json\""), std::string::npos);
    EXPECT_NE(page.find("href=\"/api/health\""), std::string::npos);
    EXPECT_NE(page.find(service.title), std::string::npos);
}

TEST_F(OpenApiTest, DocsPageEscapesHtml) {
    service.title = "<script>alert('x')</script>";

    std::string page = render_docs_page(responder, service);

    EXPECT_EQ(page.find("<script>"), std::string::npos);
    EXPECT_NE(page.find("&lt;script&gt;"), std::string::npos);
    // Payload bodies contain quotes and are escaped as well
    EXPECT_NE(page.find("{&quot;status&quot;:&quot;healthy&quot;}"), std::string::npos);
}
