#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace memkeep {

json fromJsoncpp(const Json::Value &v) {
	switch (v.type()) {
	case Json::nullValue: return nullptr;
	case Json::intValue: return (int64_t)v.asInt64();
	case Json::uintValue: return (uint64_t)v.asUInt64();
	case Json::realValue: return v.asDouble();
	case Json::stringValue: return v.asString();
	case Json::booleanValue: return v.asBool();
	case Json::arrayValue: {
		json out = json::array();
		for (const auto &item : v) out.push_back(fromJsoncpp(item));
		return out;
	}
	case Json::objectValue: {
		json out = json::object();
		for (auto it = v.begin(); it != v.end(); ++it) {
			out[it.name()] = fromJsoncpp(*it);
		}
		return out;
	}
	default:
		return nullptr;
	}
}

Json::Value toJsoncpp(const json &v) {
	if (v.is_null()) return Json::Value();
	if (v.is_boolean()) return Json::Value(v.get<bool>());
	if (v.is_number_integer() && !v.is_number_unsigned()) return Json::Value((Json::Int64)v.get<long long>());
	if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
	if (v.is_number_float()) return Json::Value(v.get<double>());
	if (v.is_string()) return Json::Value(v.get<std::string>());
	if (v.is_array()) {
		Json::Value arr(Json::arrayValue);
		for (const auto &item : v) arr.append(toJsoncpp(item));
		return arr;
	}
	if (v.is_object()) {
		Json::Value obj(Json::objectValue);
		for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
		return obj;
	}
	return Json::Value();
}

std::string getEnv(const std::string &key, const std::string &fallback) {
	const char *v = std::getenv(key.c_str());
	if (!v) return fallback;
	return std::string(v);
}

bool boolFrom(const std::string &value, bool fallback) {
	std::string v = trimCopy(value);
	if (v.empty()) return fallback;
	std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return (char)std::tolower(c); });
	return !(v == "0" || v == "false" || v == "off" || v == "no");
}

std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n");
	return s.substr(start, end - start + 1);
}

double numberOr(const std::string &s, double fallback) {
	std::string t = trimCopy(s);
	if (t.empty()) return fallback;
	try {
		size_t idx = 0;
		double v = std::stod(t, &idx);
		if (idx != t.size()) return fallback;
		if (!std::isfinite(v) || v == 0.0) return fallback;
		return v;
	} catch (const std::exception &) {
		return fallback;
	}
}

std::map<std::string, std::string> parseArgs(int argc, char **argv) {
	std::map<std::string, std::string> out;
	for (int i = 1; i < argc; i++) {
		std::string item = argv[i];
		if (item.rfind("--", 0) != 0) continue;
		auto pos = item.find('=');
		if (pos == std::string::npos) {
			out[item.substr(2)] = "true";
		} else {
			out[item.substr(2, pos - 2)] = item.substr(pos + 1);
		}
	}
	return out;
}

std::string argOrEnv(const std::map<std::string, std::string> &args,
					 const std::string &argKey,
					 const std::string &env,
					 const std::string &def) {
	auto it = args.find(argKey);
	if (it != args.end() && !it->second.empty()) return it->second;
	std::string v = getEnv(env);
	if (!v.empty()) return v;
	return def;
}

std::string nowIso() {
	auto now = std::chrono::system_clock::now();
	auto t = std::chrono::system_clock::to_time_t(now);
	auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;
	std::tm tm{};
#ifdef _WIN32
	gmtime_s(&tm, &t);
#else
	gmtime_r(&t, &tm);
#endif
	char buf[64];
	std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
	std::ostringstream oss;
	oss << buf << '.' << std::setfill('0') << std::setw(6) << us.count() << 'Z';
	return oss.str();
}

void ensureDir(const fs::path &dir) {
	if (!fs::exists(dir)) fs::create_directories(dir);
}

std::string readTextFile(const fs::path &file) {
	std::ifstream in(file, std::ios::binary);
	if (!in) return {};
	std::ostringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

void writeFileReplace(const fs::path &file, const std::string &content) {
	fs::path tmp = file;
	tmp += ".tmp";
	{
		std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
		if (!out) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
		out << content;
		out.flush();
		if (!out) throw std::runtime_error("write failed: " + tmp.string());
	}
	std::error_code ec;
	fs::rename(tmp, file, ec);
	if (ec) {
		std::error_code ignored;
		fs::remove(tmp, ignored);
		throw std::runtime_error("rename failed for " + file.string() + ": " + ec.message());
	}
}

} // namespace memkeep
