#include "memory_client.hpp"

#include <iostream>

#include <curl/curl.h>

#include "errors.hpp"

namespace memkeep {

namespace {

size_t curlWriteCb(char *ptr, size_t size, size_t nmemb, void *userdata) {
	auto *out = reinterpret_cast<std::string *>(userdata);
	size_t total = size * nmemb;
	out->append(ptr, total);
	return total;
}

std::string escapeParam(const std::string &value) {
	CURL *curl = curl_easy_init();
	if (!curl) throw MemoryError(ErrorKind::RemoteUnavailable, "curl_easy_init failed");
	char *escaped = curl_easy_escape(curl, value.c_str(), (int)value.size());
	std::string out = escaped ? escaped : "";
	curl_free(escaped);
	curl_easy_cleanup(curl);
	return out;
}

std::string errorFromBody(const std::string &body) {
	json parsed = json::parse(body, nullptr, false);
	if (parsed.is_object() && parsed.contains("error") && parsed["error"].is_string()) {
		return parsed["error"].get<std::string>();
	}
	return body.substr(0, 200);
}

} // namespace

HttpMemoryClient::HttpMemoryClient(std::string apiBase, int timeoutMs)
	: apiBase_(std::move(apiBase)), timeoutMs_(timeoutMs) {
	while (!apiBase_.empty() && apiBase_.back() == '/') apiBase_.pop_back();
}

HttpMemoryClient::HttpResult HttpMemoryClient::perform(const std::string &url, const std::string &key, const std::string *postBody) const {
	HttpResult res;
	CURL *curl = curl_easy_init();
	if (!curl) throw MemoryError(ErrorKind::RemoteUnavailable, "curl_easy_init failed");

	const std::string auth = "Authorization: Bearer " + key;
	curl_slist *headers = nullptr;
	headers = curl_slist_append(headers, auth.c_str());
	headers = curl_slist_append(headers, "Accept: application/json");
	if (postBody) headers = curl_slist_append(headers, "Content-Type: application/json");

	curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
	curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeoutMs_);
	curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, (long)timeoutMs_);
	curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl, CURLOPT_USERAGENT, "memkeep-worker/1.0");
	curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, curlWriteCb);
	curl_easy_setopt(curl, CURLOPT_WRITEDATA, &res.body);
	if (postBody) {
		curl_easy_setopt(curl, CURLOPT_POST, 1L);
		curl_easy_setopt(curl, CURLOPT_POSTFIELDS, postBody->c_str());
		curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)postBody->size());
	}

	CURLcode rc = curl_easy_perform(curl);
	if (rc == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &res.status);
	curl_slist_free_all(headers);
	curl_easy_cleanup(curl);

	if (rc != CURLE_OK) {
		throw MemoryError(ErrorKind::RemoteUnavailable, std::string(curl_easy_strerror(rc)) + " (" + url + ")");
	}
	return res;
}

std::optional<json> HttpMemoryClient::getMemory(const std::string &key, const std::string &type) {
	const std::string url = apiBase_ + "/get-memory?type=" + escapeParam(type);
	auto res = perform(url, key, nullptr);
	if (res.status == 404) return std::nullopt;
	if (res.status < 200 || res.status >= 300) {
		throw MemoryError(ErrorKind::RemoteUnavailable, "HTTP " + std::to_string(res.status) + ": " + errorFromBody(res.body));
	}
	json parsed = json::parse(res.body, nullptr, false);
	if (parsed.is_discarded() || !parsed.is_object()) {
		throw MemoryError(ErrorKind::RemoteUnavailable, "invalid response from " + url);
	}
	if (!parsed.contains("memory")) return std::nullopt;
	return parsed["memory"];
}

void HttpMemoryClient::post(const std::string &path, const std::string &key, const std::string &type, const json &entry, const char *op) const {
	const std::string body = json{{"type", type}, {"entry", entry}}.dump();
	auto res = perform(apiBase_ + path, key, &body);
	if (res.status < 200 || res.status >= 300) {
		throw MemoryError(ErrorKind::RemoteUnavailable,
						  std::string(op) + " HTTP " + std::to_string(res.status) + ": " + errorFromBody(res.body));
	}
}

void HttpMemoryClient::logMemory(const std::string &key, const std::string &type, const json &entry) {
	post("/log-memory", key, type, entry, "log-memory");
	std::cout << "[MemoryClient] logged [" << type << "]" << std::endl;
}

void HttpMemoryClient::overwriteMemory(const std::string &key, const std::string &type, const json &entry) {
	post("/overwrite-memory", key, type, entry, "overwrite-memory");
	std::cout << "[MemoryClient] overwrote [" << type << "]" << std::endl;
}

} // namespace memkeep
