#include "memory_store.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

#include "errors.hpp"
#include "key_registry.hpp"

namespace memkeep {

namespace {

const char *kStructuredExt = ".json";
const char *kRawExt = ".txt";
const char *kLogExt = ".log";
const char *kLogCategory = "experience";

// Raw logs hold one line per entry.
std::string escapeLineBreaks(const std::string &text) {
	std::string out;
	out.reserve(text.size());
	for (char ch : text) {
		if (ch == '\n') {
			out += "\\n";
		} else if (ch == '\r') {
			out += "\\r";
		} else {
			out += ch;
		}
	}
	return out;
}

} // namespace

const char *formatName(MemoryFormat format) {
	return format == MemoryFormat::Structured ? "json" : "text";
}

MemoryEntry MemoryEntry::structuredValue(json value) {
	MemoryEntry e;
	e.kind = MemoryFormat::Structured;
	e.structured = std::move(value);
	return e;
}

MemoryEntry MemoryEntry::rawText(std::string text) {
	MemoryEntry e;
	e.kind = MemoryFormat::Raw;
	e.text = std::move(text);
	return e;
}

std::optional<MemoryEntry> MemoryEntry::forAppend(const json &entry) {
	if (entry.is_null() || entry.is_discarded()) return std::nullopt;
	if (entry.is_object()) return structuredValue(entry);
	if (entry.is_string()) return rawText(entry.get<std::string>());
	return rawText(entry.dump());
}

std::optional<MemoryEntry> MemoryEntry::forOverwrite(const json &entry) {
	if (entry.is_null() || entry.is_discarded()) return std::nullopt;
	if (entry.is_object() || entry.is_array()) return structuredValue(entry);
	if (entry.is_string()) return rawText(entry.get<std::string>());
	return rawText(entry.dump());
}

MemoryStore::MemoryStore(fs::path baseDir) : baseDir_(std::move(baseDir)) {
	ensureDir(baseDir_);
}

bool MemoryStore::isValidCategory(const std::string &category) {
	if (category.empty() || category == "." || category == "..") return false;
	return category.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void MemoryStore::checkNames(const std::string &tenant, const std::string &category) const {
	if (!KeyRegistry::isUsableKey(tenant)) throw MemoryError(ErrorKind::Unauthorized, "Unauthorized");
	if (!isValidCategory(category)) throw MemoryError(ErrorKind::BadRequest, "Invalid memory type");
}

fs::path MemoryStore::resolvePath(const std::string &tenant, const std::string &category, bool structured) {
	checkNames(tenant, category);
	fs::path dir = baseDir_ / tenant;
	ensureDir(dir);
	const char *ext = structured ? kStructuredExt : (category == kLogCategory ? kLogExt : kRawExt);
	return dir / (category + ext);
}

MemoryStore::PairLock::PairLock(MemoryStore &store, const std::string &tenant, const std::string &category)
	: store_(store), key_(tenant + '\n' + category) {
	{
		std::lock_guard<std::mutex> lock(store_.locksMu_);
		auto &slot = store_.locks_[key_];
		if (!slot) slot = std::make_shared<std::mutex>();
		mu_ = slot;
	}
	mu_->lock();
}

MemoryStore::PairLock::~PairLock() {
	mu_->unlock();
	std::lock_guard<std::mutex> lock(store_.locksMu_);
	mu_.reset();
	auto it = store_.locks_.find(key_);
	if (it != store_.locks_.end() && it->second.use_count() == 1) store_.locks_.erase(it);
}

size_t MemoryStore::activeLocks() const {
	std::lock_guard<std::mutex> lock(locksMu_);
	return locks_.size();
}

json MemoryStore::loadArrayForAppend(const fs::path &file) {
	if (!fs::exists(file)) return json::array();
	json existing = json::parse(readTextFile(file), nullptr, false);
	if (existing.is_discarded()) {
		std::cerr << "[MemoryStore] Warning: " << file.string() << " is not valid JSON, starting a new list" << std::endl;
		return json::array();
	}
	if (existing.is_array()) return existing;
	// An overwrite stored a single value; keep it as the first element.
	json out = json::array();
	out.push_back(std::move(existing));
	return out;
}

std::string MemoryStore::append(const std::string &tenant, const std::string &category, const MemoryEntry &entry) {
	checkNames(tenant, category);
	PairLock lock(*this, tenant, category);
	const std::string timestamp = nowIso();

	if (entry.kind == MemoryFormat::Structured) {
		if (!entry.structured.is_object()) {
			throw MemoryError(ErrorKind::BadRequest, "structured append requires an object");
		}
		fs::path file = resolvePath(tenant, category, true);
		json logs = loadArrayForAppend(file);
		json stamped = entry.structured;
		stamped["timestamp"] = timestamp;
		logs.push_back(std::move(stamped));
		writeFileReplace(file, logs.dump(2));
		return timestamp;
	}

	fs::path file = resolvePath(tenant, category, false);
	std::ofstream out(file, std::ios::binary | std::ios::app);
	if (!out) throw std::runtime_error("cannot open " + file.string() + " for append");
	out << "[" << timestamp << "] " << escapeLineBreaks(entry.text) << "\n";
	out.flush();
	if (!out) throw std::runtime_error("append failed: " + file.string());
	return timestamp;
}

std::optional<StoredMemory> MemoryStore::read(const std::string &tenant, const std::string &category) {
	checkNames(tenant, category);
	PairLock lock(*this, tenant, category);

	fs::path jsonFile = resolvePath(tenant, category, true);
	if (fs::exists(jsonFile)) {
		json payload = json::parse(readTextFile(jsonFile), nullptr, false);
		if (payload.is_discarded()) {
			throw MemoryError(ErrorKind::StorageCorrupt, "Stored memory is corrupt");
		}
		return StoredMemory{std::move(payload), MemoryFormat::Structured};
	}
	fs::path rawFile = resolvePath(tenant, category, false);
	if (fs::exists(rawFile)) {
		return StoredMemory{json(readTextFile(rawFile)), MemoryFormat::Raw};
	}
	return std::nullopt;
}

void MemoryStore::overwrite(const std::string &tenant, const std::string &category, const MemoryEntry &entry) {
	checkNames(tenant, category);
	PairLock lock(*this, tenant, category);

	const bool structured = entry.kind == MemoryFormat::Structured;
	fs::path target = resolvePath(tenant, category, structured);
	fs::path stale = resolvePath(tenant, category, !structured);
	if (structured) {
		writeFileReplace(target, entry.structured.dump(2));
	} else {
		writeFileReplace(target, trimCopy(entry.text) + "\n");
	}

	std::error_code ec;
	if (fs::exists(stale, ec) && !fs::remove(stale, ec) && ec) {
		std::cerr << "[MemoryStore] Warning: could not remove stale " << stale.string() << ": " << ec.message() << std::endl;
	}
}

} // namespace memkeep
