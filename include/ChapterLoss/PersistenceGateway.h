#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "ChapterLoss/KeyValueStore.h"
#include "ChapterLoss/LossCollaborators.h"
#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss
{
	struct SaveResult
	{
		bool success{ false };
		bool backupWritten{ false };
		std::size_t dataSize{ 0 };
		std::string message{};
	};

	enum class LoadSource : std::uint8_t
	{
		kEmpty = 0,
		kPrimary,
		kRepaired,
		kBackup,
		kReset
	};

	[[nodiscard]] constexpr std::string_view ToString(LoadSource a_source) noexcept
	{
		switch (a_source) {
		case LoadSource::kEmpty:
			return "empty";
		case LoadSource::kPrimary:
			return "primary";
		case LoadSource::kRepaired:
			return "repaired";
		case LoadSource::kBackup:
			return "backup_restore";
		case LoadSource::kReset:
			return "reset_to_default";
		}
		return "empty";
	}

	struct LoadResult
	{
		bool success{ false };
		bool wasEmpty{ false };
		LoadSource source{ LoadSource::kEmpty };
		// Set whenever success is true and the chapter had data (or was reset).
		std::optional<ChapterLossData> data{};
		std::string message{};
	};

	struct SaveDataInfo
	{
		std::string chapterId{};
		std::uint32_t lossCount{ 0 };
		std::int64_t lastSaved{ 0 };
		std::size_t dataSize{ 0 };
		bool hasBackup{ false };
	};

	// Durable home of one ledger blob per chapter plus its backup copy. Load walks the recovery
	// ladder (repair handler, backup promotion, reset) so it never hands back invalid data.
	class PersistenceGateway
	{
	public:
		explicit PersistenceGateway(IKeyValueStore& a_store, ILossRecoveryHandler* a_recovery = nullptr);

		void SetRecoveryHandler(ILossRecoveryHandler* a_recovery) noexcept { _recovery = a_recovery; }

		SaveResult Save(std::string_view a_chapterId, const ChapterLossData& a_data);
		[[nodiscard]] LoadResult Load(std::string_view a_chapterId);

		// Drops primary and backup.
		bool Remove(std::string_view a_chapterId);
		[[nodiscard]] bool HasSaveData(std::string_view a_chapterId) const;
		[[nodiscard]] std::optional<SaveDataInfo> GetSaveDataInfo(std::string_view a_chapterId) const;

		bool SaveSuspendRecord(const SuspendRecord& a_record);
		[[nodiscard]] std::optional<SuspendRecord> LoadSuspendRecord(std::string_view a_chapterId) const;
		bool RemoveSuspendRecord(std::string_view a_chapterId);
		[[nodiscard]] bool HasSuspendRecord(std::string_view a_chapterId) const;

	private:
		[[nodiscard]] bool TryDecode(std::string_view a_chapterId, std::string_view a_payload, ChapterLossData& a_out) const;
		[[nodiscard]] LoadResult Recover(std::string_view a_chapterId, std::string_view a_primaryPayload);
		[[nodiscard]] bool KeyExists(std::string_view a_key) const;

		IKeyValueStore& _store;
		ILossRecoveryHandler* _recovery{ nullptr };
	};
}
