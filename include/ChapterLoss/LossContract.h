#pragma once

#include <string>
#include <string_view>

namespace ChapterLoss::LossContract
{
	inline constexpr std::string_view kPrimaryKeyPrefix = "loss:";
	inline constexpr std::string_view kBackupKeyPrefix = "loss:backup:";
	inline constexpr std::string_view kSuspendKeyPrefix = "loss:suspend:";

	// Chapter ids that would make PrimaryKey collide with another chapter's backup or suspend key.
	[[nodiscard]] constexpr bool IsReservedChapterId(std::string_view a_chapterId) noexcept
	{
		const auto reserved = [&](std::string_view a_prefix) {
			const auto tail = a_prefix.substr(kPrimaryKeyPrefix.size());
			return a_chapterId.substr(0, tail.size()) == tail;
		};
		return reserved(kBackupKeyPrefix) || reserved(kSuspendKeyPrefix);
	}

	inline constexpr std::string_view kFieldChapterId = "chapterId";
	inline constexpr std::string_view kFieldLostCharacters = "lostCharacters";
	inline constexpr std::string_view kFieldLossHistory = "lossHistory";
	inline constexpr std::string_view kFieldChapterStartTime = "chapterStartTime";
	inline constexpr std::string_view kFieldVersion = "version";

	inline constexpr std::string_view kFieldCharacterId = "characterId";
	inline constexpr std::string_view kFieldName = "name";
	inline constexpr std::string_view kFieldLostAt = "lostAt";
	inline constexpr std::string_view kFieldTurn = "turn";
	inline constexpr std::string_view kFieldCause = "cause";
	inline constexpr std::string_view kFieldLevel = "level";
	inline constexpr std::string_view kFieldWasRecruited = "wasRecruited";
	inline constexpr std::string_view kFieldPosition = "position";
	inline constexpr std::string_view kFieldStageId = "stageId";
	inline constexpr std::string_view kFieldRecoverable = "recoverable";

	inline constexpr std::string_view kFieldCauseType = "type";
	inline constexpr std::string_view kFieldCauseDescription = "description";
	inline constexpr std::string_view kFieldCauseSourceId = "sourceId";
	inline constexpr std::string_view kFieldCauseSourceName = "sourceName";
	inline constexpr std::string_view kFieldCauseDamageAmount = "damageAmount";
	inline constexpr std::string_view kFieldCauseStatusType = "statusType";
	inline constexpr std::string_view kFieldCauseTimestamp = "timestamp";

	inline constexpr std::string_view kFieldX = "x";
	inline constexpr std::string_view kFieldY = "y";

	inline constexpr std::string_view kFieldSuspendedAt = "suspendedAt";
	inline constexpr std::string_view kFieldGameState = "gameState";
	inline constexpr std::string_view kFieldCurrentTurn = "currentTurn";
	inline constexpr std::string_view kFieldTotalLosses = "totalLosses";
	inline constexpr std::string_view kFieldDangerLevels = "dangerLevels";
	inline constexpr std::string_view kFieldUnits = "units";
	inline constexpr std::string_view kFieldUnitId = "id";
	inline constexpr std::string_view kFieldCurrentHP = "currentHP";
	inline constexpr std::string_view kFieldHasActed = "hasActed";
	inline constexpr std::string_view kFieldHasMoved = "hasMoved";

	[[nodiscard]] inline std::string PrimaryKey(std::string_view a_chapterId)
	{
		std::string key(kPrimaryKeyPrefix);
		key.append(a_chapterId);
		return key;
	}

	[[nodiscard]] inline std::string BackupKey(std::string_view a_chapterId)
	{
		std::string key(kBackupKeyPrefix);
		key.append(a_chapterId);
		return key;
	}

	[[nodiscard]] inline std::string SuspendKey(std::string_view a_chapterId)
	{
		std::string key(kSuspendKeyPrefix);
		key.append(a_chapterId);
		return key;
	}
}
