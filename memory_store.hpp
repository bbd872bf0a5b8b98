#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "util.hpp"

namespace memkeep {

enum class MemoryFormat { Structured, Raw };

const char *formatName(MemoryFormat format);

// Caller intent for a write. Built from the request's `entry` value:
//   append:    object -> Structured, string -> Raw, other non-null -> Raw (compact JSON text)
//   overwrite: object or array -> Structured, string -> Raw (trimmed), other non-null -> Raw
struct MemoryEntry {
	MemoryFormat kind{MemoryFormat::Raw};
	json structured;
	std::string text;

	static MemoryEntry structuredValue(json value);
	static MemoryEntry rawText(std::string text);
	static std::optional<MemoryEntry> forAppend(const json &entry);
	static std::optional<MemoryEntry> forOverwrite(const json &entry);
};

struct StoredMemory {
	json payload;
	MemoryFormat format{MemoryFormat::Raw};
};

// Per-tenant, per-category file storage rooted at baseDir/<tenant>/.
class MemoryStore {
public:
	explicit MemoryStore(fs::path baseDir);

	const fs::path &baseDir() const { return baseDir_; }

	// Creates the tenant directory on demand.
	fs::path resolvePath(const std::string &tenant, const std::string &category, bool structured);

	// Returns the timestamp stamped on the entry or log line.
	std::string append(const std::string &tenant, const std::string &category, const MemoryEntry &entry);
	// Throws MemoryError(StorageCorrupt) if the structured file does not parse.
	std::optional<StoredMemory> read(const std::string &tenant, const std::string &category);
	void overwrite(const std::string &tenant, const std::string &category, const MemoryEntry &entry);

	static bool isValidCategory(const std::string &category);

	// Number of (tenant, category) locks currently held or waited on.
	size_t activeLocks() const;

private:
	// Serialises one (tenant, category) pair; the table entry is dropped with its last holder.
	class PairLock {
	public:
		PairLock(MemoryStore &store, const std::string &tenant, const std::string &category);
		~PairLock();
		PairLock(const PairLock &) = delete;
		PairLock &operator=(const PairLock &) = delete;

	private:
		MemoryStore &store_;
		std::string key_;
		std::shared_ptr<std::mutex> mu_;
	};

	json loadArrayForAppend(const fs::path &file);
	void checkNames(const std::string &tenant, const std::string &category) const;

	fs::path baseDir_;
	mutable std::mutex locksMu_;
	std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;
};

} // namespace memkeep
