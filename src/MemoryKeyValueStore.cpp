#include "ChapterLoss/KeyValueStore.h"

namespace ChapterLoss
{
	KeyValueReadStatus MemoryKeyValueStore::Get(std::string_view a_key, std::string& a_outValue) const
	{
		std::scoped_lock lk{ _lock };
		if (_failingReads.find(a_key) != _failingReads.end()) {
			return KeyValueReadStatus::kIoError;
		}
		const auto it = _entries.find(a_key);
		if (it == _entries.end()) {
			return KeyValueReadStatus::kMissing;
		}
		a_outValue = it->second;
		return KeyValueReadStatus::kFound;
	}

	bool MemoryKeyValueStore::Set(std::string_view a_key, std::string_view a_value)
	{
		std::scoped_lock lk{ _lock };
		if (_failingWrites.find(a_key) != _failingWrites.end()) {
			return false;
		}
		_entries.insert_or_assign(std::string(a_key), std::string(a_value));
		return true;
	}

	bool MemoryKeyValueStore::Remove(std::string_view a_key)
	{
		std::scoped_lock lk{ _lock };
		if (const auto it = _entries.find(a_key); it != _entries.end()) {
			_entries.erase(it);
		}
		return true;
	}

	void MemoryKeyValueStore::FailWritesFor(std::string_view a_key)
	{
		std::scoped_lock lk{ _lock };
		_failingWrites.emplace(a_key);
	}

	void MemoryKeyValueStore::FailReadsFor(std::string_view a_key)
	{
		std::scoped_lock lk{ _lock };
		_failingReads.emplace(a_key);
	}

	void MemoryKeyValueStore::ClearFailures()
	{
		std::scoped_lock lk{ _lock };
		_failingWrites.clear();
		_failingReads.clear();
	}

	bool MemoryKeyValueStore::Contains(std::string_view a_key) const
	{
		std::scoped_lock lk{ _lock };
		return _entries.find(a_key) != _entries.end();
	}

	std::size_t MemoryKeyValueStore::Size() const
	{
		std::scoped_lock lk{ _lock };
		return _entries.size();
	}
}
