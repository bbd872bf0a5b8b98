#include "errors.hpp"
#include "memory_store.hpp"
#include "util.hpp"

#include "test_support.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using memkeep::ErrorKind;
using memkeep::json;
using memkeep::MemoryEntry;
using memkeep::MemoryError;
using memkeep::MemoryFormat;
using memkeep::MemoryStore;
using memkeep::tests::Log;
using memkeep::tests::Require;

namespace {

void Pause() {
	std::this_thread::sleep_for(std::chrono::milliseconds(2));
}

void ScenarioResolvePath() {
	Log("scenario: resolve path and extensions");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	auto core = store.resolvePath("tenant", "core", true);
	Require(core == dir.path() / "tenant" / "core.json", "structured path mismatch");
	Require(std::filesystem::exists(dir.path() / "tenant"), "tenant directory should be created");
	Require(store.resolvePath("tenant", "notebook", false).filename() == "notebook.txt", "raw path should use .txt");
	Require(store.resolvePath("tenant", "experience", false).filename() == "experience.log",
			"raw experience should use .log");
	Require(store.resolvePath("tenant", "experience", true).filename() == "experience.json",
			"structured experience should use .json");
}

void ScenarioStructuredAppendOrder() {
	Log("scenario: structured appends keep order and get timestamps");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	std::vector<json> entries = {json{{"fact", "x"}}, json{{"fact", "y"}, {"n", 2}}, json{{"fact", "z"}}};
	for (const auto &e : entries) {
		store.append("tenant", "core", *MemoryEntry::forAppend(e));
		Pause();
	}
	auto stored = store.read("tenant", "core");
	Require(stored.has_value(), "structured memory should exist");
	Require(stored->format == MemoryFormat::Structured, "format should be structured");
	Require(stored->payload.is_array() && stored->payload.size() == 3, "expected three elements");
	for (size_t i = 0; i < entries.size(); i++) {
		const auto &got = stored->payload[i];
		Require(got["fact"] == entries[i]["fact"], "append order mismatch at " + std::to_string(i));
		Require(got.contains("timestamp") && got["timestamp"].is_string(), "missing timestamp at " + std::to_string(i));
	}
	Require(stored->payload[1]["n"] == 2, "fields should be preserved");
	Require(stored->payload[0]["timestamp"] != stored->payload[1]["timestamp"], "timestamps should differ");
}

void ScenarioRawAppend() {
	Log("scenario: raw appends are timestamped lines");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	const auto ts1 = store.append("tenant", "experience", *MemoryEntry::forAppend(json("hello")));
	const auto ts2 = store.append("tenant", "experience", *MemoryEntry::forAppend(json("world")));
	auto stored = store.read("tenant", "experience");
	Require(stored.has_value() && stored->format == MemoryFormat::Raw, "raw memory should exist");
	const std::string expected = "[" + ts1 + "] hello\n[" + ts2 + "] world\n";
	Require(stored->payload.get<std::string>() == expected, "raw log content mismatch");
	Require(std::filesystem::exists(dir.path() / "tenant" / "experience.log"), "experience log file should exist");
}

void ScenarioRawAppendStaysOneLine() {
	Log("scenario: embedded line breaks stay on the entry's line");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	const auto ts = store.append("tenant", "notebook", *MemoryEntry::forAppend(json("first\nsecond\r\nthird")));
	auto stored = store.read("tenant", "notebook");
	const std::string expected = "[" + ts + "] first\\nsecond\\r\\nthird\n";
	Require(stored->payload.get<std::string>() == expected, "line breaks should be escaped");
}

void ScenarioEntryShapes() {
	Log("scenario: entry shape rules");
	Require(!MemoryEntry::forAppend(json()).has_value(), "null entry is absent");
	Require(MemoryEntry::forAppend(json::object())->kind == MemoryFormat::Structured, "object appends structured");
	Require(MemoryEntry::forAppend(json::array({1, 2}))->kind == MemoryFormat::Raw, "array appends raw");
	Require(MemoryEntry::forAppend(json::array({1, 2}))->text == "[1,2]", "array appends its JSON text");
	Require(MemoryEntry::forAppend(json(42))->text == "42", "number appends its JSON text");
	Require(MemoryEntry::forOverwrite(json::array())->kind == MemoryFormat::Structured, "array overwrites structured");
	Require(MemoryEntry::forOverwrite(json("  t  "))->kind == MemoryFormat::Raw, "string overwrites raw");
	Require(!MemoryEntry::forOverwrite(json()).has_value(), "null overwrite is absent");
}

void ScenarioReadPrecedence() {
	Log("scenario: structured wins when both files exist");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	store.append("tenant", "notebook", *MemoryEntry::forAppend(json("raw line")));
	store.append("tenant", "notebook", *MemoryEntry::forAppend(json{{"page", 1}}));
	Require(std::filesystem::exists(dir.path() / "tenant" / "notebook.txt"), "raw file should exist");
	Require(std::filesystem::exists(dir.path() / "tenant" / "notebook.json"), "structured file should exist");
	auto stored = store.read("tenant", "notebook");
	Require(stored->format == MemoryFormat::Structured, "structured file must take precedence");
	Require(stored->payload.size() == 1 && stored->payload[0]["page"] == 1, "structured payload mismatch");
}

void ScenarioOverwriteReplaces() {
	Log("scenario: overwrite replaces content and removes the stale representation");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	store.append("tenant", "core", *MemoryEntry::forAppend(json{{"a", 1}}));
	store.overwrite("tenant", "core", *MemoryEntry::forOverwrite(json{{"b", 2}}));
	auto stored = store.read("tenant", "core");
	Require(stored->format == MemoryFormat::Structured, "overwrite with object stays structured");
	Require(stored->payload == json({{"b", 2}}), "overwrite must store the value verbatim");

	store.overwrite("tenant", "core", *MemoryEntry::forOverwrite(json("  plain text \n")));
	Require(!std::filesystem::exists(dir.path() / "tenant" / "core.json"), "stale structured file must be removed");
	stored = store.read("tenant", "core");
	Require(stored->format == MemoryFormat::Raw, "raw overwrite should be visible");
	Require(stored->payload.get<std::string>() == "plain text\n", "raw overwrite should be trimmed plus newline");

	store.overwrite("tenant", "core", *MemoryEntry::forOverwrite(json::array({json{{"id", 1}}})));
	Require(!std::filesystem::exists(dir.path() / "tenant" / "core.txt"), "stale raw file must be removed");
	stored = store.read("tenant", "core");
	Require(stored->payload.is_array() && stored->payload.size() == 1, "array overwrite should be stored as-is");
	Require(!stored->payload[0].contains("timestamp"), "overwrite must not stamp entries");
}

void ScenarioAppendAfterObjectOverwrite() {
	Log("scenario: append after single-object overwrite keeps the object");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	store.overwrite("tenant", "core", *MemoryEntry::forOverwrite(json{{"profile", "p"}}));
	store.append("tenant", "core", *MemoryEntry::forAppend(json{{"fact", "f"}}));
	auto stored = store.read("tenant", "core");
	Require(stored->payload.is_array() && stored->payload.size() == 2, "expected the object plus the new entry");
	Require(stored->payload[0]["profile"] == "p", "previous object should be first");
	Require(stored->payload[1]["fact"] == "f", "new entry should be second");
}

void ScenarioCorruptStructuredFile() {
	Log("scenario: corrupt structured file");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	const auto file = store.resolvePath("tenant", "core", true);
	{
		std::ofstream out(file);
		out << "[{\"broken\": ";
	}
	bool corrupt = false;
	try {
		(void)store.read("tenant", "core");
	} catch (const MemoryError &e) {
		corrupt = e.kind() == ErrorKind::StorageCorrupt;
	}
	Require(corrupt, "direct read must surface StorageCorrupt");

	store.append("tenant", "core", *MemoryEntry::forAppend(json{{"fresh", true}}));
	auto stored = store.read("tenant", "core");
	Require(stored->payload.size() == 1 && stored->payload[0]["fresh"] == true, "append should recover with an empty list");
}

void ScenarioNotFoundAndIsolation() {
	Log("scenario: not found and tenant isolation");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	Require(!store.read("tenant-a", "core").has_value(), "fresh category should be absent");
	store.append("tenant-a", "core", *MemoryEntry::forAppend(json{{"owner", "a"}}));
	store.append("tenant-b", "core", *MemoryEntry::forAppend(json{{"owner", "b"}}));
	auto a = store.read("tenant-a", "core");
	auto b = store.read("tenant-b", "core");
	Require(a->payload.size() == 1 && a->payload[0]["owner"] == "a", "tenant a sees only its entry");
	Require(b->payload.size() == 1 && b->payload[0]["owner"] == "b", "tenant b sees only its entry");
}

void ScenarioInvalidNames() {
	Log("scenario: invalid categories rejected");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	for (const std::string bad : {"", ".", "..", "../escape", "a/b", "a\\b"}) {
		bool rejected = false;
		try {
			store.append("tenant", bad, *MemoryEntry::forAppend(json("x")));
		} catch (const MemoryError &e) {
			rejected = e.kind() == ErrorKind::BadRequest;
		}
		Require(rejected, "category should be rejected: '" + bad + "'");
	}
	Require(MemoryStore::isValidCategory("my notes"), "spaces are allowed");
	Require(MemoryStore::isValidCategory("日记"), "non-ASCII categories are allowed");
}

void ScenarioLockTableBounded() {
	Log("scenario: lock table does not grow with distinct categories");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	for (int i = 0; i < 500; i++) {
		Require(!store.read("tenant", "topic-" + std::to_string(i)).has_value(), "fresh category should be absent");
	}
	store.append("tenant", "core", *MemoryEntry::forAppend(json{{"a", 1}}));
	store.overwrite("tenant", "core", *MemoryEntry::forOverwrite(json("x")));
	Require(store.activeLocks() == 0, "no locks should remain after the calls return");
}

void ScenarioConcurrentAppends() {
	Log("scenario: concurrent structured appends do not lose updates");
	memkeep::tests::ScopedDir dir("store");
	MemoryStore store(dir.path());
	constexpr int kThreads = 4;
	constexpr int kPerThread = 10;
	std::vector<std::thread> threads;
	for (int t = 0; t < kThreads; t++) {
		threads.emplace_back([&store, t]() {
			for (int i = 0; i < kPerThread; i++) {
				store.append("tenant", "core", *MemoryEntry::forAppend(json{{"t", t}, {"i", i}}));
			}
		});
	}
	for (auto &th : threads) th.join();
	Require(store.activeLocks() == 0, "locks should be released after concurrent use");
	auto stored = store.read("tenant", "core");
	Require(stored->payload.size() == (size_t)(kThreads * kPerThread), "every append should be kept");
}

} // namespace

int main() {
	try {
		Log("memory_store_test: start");
		ScenarioResolvePath();
		ScenarioStructuredAppendOrder();
		ScenarioRawAppend();
		ScenarioEntryShapes();
		ScenarioReadPrecedence();
		ScenarioOverwriteReplaces();
		ScenarioAppendAfterObjectOverwrite();
		ScenarioCorruptStructuredFile();
		ScenarioNotFoundAndIsolation();
		ScenarioInvalidNames();
		ScenarioConcurrentAppends();
		ScenarioRawAppendStaysOneLine();
		ScenarioLockTableBounded();
		Log("memory_store_test: finished");
		return EXIT_SUCCESS;
	} catch (const std::exception &ex) {
		memkeep::tests::LogError(ex.what());
		return EXIT_FAILURE;
	}
}
