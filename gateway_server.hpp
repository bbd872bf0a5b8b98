#pragma once

#include <functional>
#include <memory>
#include <string>

#include <drogon/drogon.h>

#include "config.hpp"
#include "memory_api.hpp"

namespace memkeep {

class GatewayServer {
public:
	GatewayServer(std::shared_ptr<MemoryApi> api, ServerConfig config);

	void setupRoutes();
	void listen();

private:
	using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

	json parseRequestBody(const drogon::HttpRequestPtr &req) const;
	void respond(const Callback &cb, const ApiResponse &res) const;

	std::shared_ptr<MemoryApi> api_;
	ServerConfig config_;
};

} // namespace memkeep
