#include "gateway_server.hpp"

#include <iostream>

namespace memkeep {

GatewayServer::GatewayServer(std::shared_ptr<MemoryApi> api, ServerConfig config)
	: api_(std::move(api)), config_(std::move(config)) {}

json GatewayServer::parseRequestBody(const drogon::HttpRequestPtr &req) const {
	auto payload = req->getJsonObject();
	if (payload) return fromJsoncpp(*payload);
	auto body = req->getBody();
	if (body.empty()) return json::object();
	return json::parse(std::string(body), nullptr, false);
}

void GatewayServer::respond(const Callback &cb, const ApiResponse &res) const {
	auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(res.body));
	resp->setStatusCode(static_cast<drogon::HttpStatusCode>(res.status));
	cb(resp);
}

void GatewayServer::setupRoutes() {
	drogon::app().registerHandler("/api/log-memory", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		try {
			respond(cb, api_->logMemory(req->getHeader("authorization"), parseRequestBody(req)));
		} catch (const std::exception &e) {
			respond(cb, ApiResponse{500, json{{"error", e.what()}}});
		}
	}, {drogon::Post});

	drogon::app().registerHandler("/api/get-memory", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		try {
			respond(cb, api_->getMemory(req->getHeader("authorization"), req->getParameter("type")));
		} catch (const std::exception &e) {
			respond(cb, ApiResponse{500, json{{"error", e.what()}}});
		}
	}, {drogon::Get});

	drogon::app().registerHandler("/api/overwrite-memory", [this](const drogon::HttpRequestPtr &req, Callback &&cb) {
		try {
			respond(cb, api_->overwriteMemory(req->getHeader("authorization"), parseRequestBody(req)));
		} catch (const std::exception &e) {
			respond(cb, ApiResponse{500, json{{"error", e.what()}}});
		}
	}, {drogon::Post});

	drogon::app().registerHandler("/api/health", [this](const drogon::HttpRequestPtr &, Callback &&cb) {
		respond(cb, api_->health());
	}, {drogon::Get});
}

void GatewayServer::listen() {
	std::cout << "[GatewayServer] Listening on http://" << config_.host << ":" << config_.port << std::endl;
	std::cout << "[GatewayServer] memory dir: " << config_.memoryDir.string() << std::endl;
	drogon::app().setThreadNum(config_.threads);
	drogon::app().addListener(config_.host, (uint16_t)config_.port);
	drogon::app().run();
}

} // namespace memkeep
