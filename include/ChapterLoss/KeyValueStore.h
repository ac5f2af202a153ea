#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace ChapterLoss
{
	enum class KeyValueReadStatus : std::uint8_t
	{
		kFound = 0,
		kMissing,
		kIoError
	};

	// Durable string storage behind the persistence gateway.
	class IKeyValueStore
	{
	public:
		virtual ~IKeyValueStore() = default;

		[[nodiscard]] virtual KeyValueReadStatus Get(std::string_view a_key, std::string& a_outValue) const = 0;
		[[nodiscard]] virtual bool Set(std::string_view a_key, std::string_view a_value) = 0;
		// Removing an absent key succeeds.
		[[nodiscard]] virtual bool Remove(std::string_view a_key) = 0;

		// Moves an unreadable entry out of the way. Stores without a side area just remove it.
		[[nodiscard]] virtual bool Quarantine(std::string_view a_key) { return Remove(a_key); }
	};

	class MemoryKeyValueStore final : public IKeyValueStore
	{
	public:
		[[nodiscard]] KeyValueReadStatus Get(std::string_view a_key, std::string& a_outValue) const override;
		[[nodiscard]] bool Set(std::string_view a_key, std::string_view a_value) override;
		[[nodiscard]] bool Remove(std::string_view a_key) override;

		// Test hooks: simulate quota/IO failures for specific keys.
		void FailWritesFor(std::string_view a_key);
		void FailReadsFor(std::string_view a_key);
		void ClearFailures();

		[[nodiscard]] bool Contains(std::string_view a_key) const;
		[[nodiscard]] std::size_t Size() const;

	private:
		mutable std::mutex _lock;
		std::map<std::string, std::string, std::less<>> _entries;
		std::set<std::string, std::less<>> _failingWrites;
		std::set<std::string, std::less<>> _failingReads;
	};

	// One file per key under a root directory. Writes go through a temp file and rename;
	// unreadable entries are renamed aside as <file>.corrupt.<unix>.<pid>.
	class FileKeyValueStore final : public IKeyValueStore
	{
	public:
		explicit FileKeyValueStore(std::filesystem::path a_root);

		[[nodiscard]] KeyValueReadStatus Get(std::string_view a_key, std::string& a_outValue) const override;
		[[nodiscard]] bool Set(std::string_view a_key, std::string_view a_value) override;
		[[nodiscard]] bool Remove(std::string_view a_key) override;
		[[nodiscard]] bool Quarantine(std::string_view a_key) override;

		[[nodiscard]] const std::filesystem::path& Root() const noexcept { return _root; }
		[[nodiscard]] std::filesystem::path PathForKey(std::string_view a_key) const;

		// Keys map to file names with every byte outside [A-Za-z0-9._-] escaped as %XX.
		[[nodiscard]] static std::string EncodeKey(std::string_view a_key);

	private:
		std::filesystem::path _root;
		mutable std::mutex _ioLock;
	};
}
