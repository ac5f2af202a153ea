#include "ChapterLoss/LossValidation.h"

#include <algorithm>
#include <set>
#include <string>

namespace ChapterLoss::Validation
{
	bool IsValidLossCause(const LossCause& a_cause)
	{
		if (a_cause.timestamp <= 0) {
			return false;
		}
		if (a_cause.damageAmount && *a_cause.damageAmount < 0.0) {
			return false;
		}
		return true;
	}

	bool IsValidLostCharacter(const LostCharacter& a_lost)
	{
		return !IsBlank(a_lost.characterId) &&
		       !IsBlank(a_lost.name) &&
		       a_lost.lostAt > 0 &&
		       a_lost.turn >= 1 &&
		       a_lost.level >= 1 &&
		       IsValidLossCause(a_lost.cause);
	}

	bool IsValidLossRecord(const LossRecord& a_record)
	{
		return IsValidLostCharacter(a_record) &&
		       !IsBlank(a_record.chapterId) &&
		       !IsBlank(a_record.stageId);
	}

	bool IsValidChapterLossSummary(const ChapterLossSummary& a_summary)
	{
		if (IsBlank(a_summary.chapterId) || IsBlank(a_summary.chapterName)) {
			return false;
		}
		if (a_summary.chapterDuration < 0 || a_summary.totalTurns < 0 || a_summary.completedAt <= 0) {
			return false;
		}
		if (a_summary.isPerfectClear != a_summary.lostCharacters.empty()) {
			return false;
		}
		const bool lostOk = std::all_of(
			a_summary.lostCharacters.begin(),
			a_summary.lostCharacters.end(),
			[](const LostCharacter& a_lost) { return IsValidLostCharacter(a_lost); });
		const bool survivedOk = std::none_of(
			a_summary.survivedCharacters.begin(),
			a_summary.survivedCharacters.end(),
			[](const std::string& a_id) { return IsBlank(a_id); });
		return lostOk && survivedOk;
	}

	bool IsValidChapterLossData(const ChapterLossData& a_data)
	{
		if (IsBlank(a_data.chapterId) || a_data.chapterStartTime <= 0 || a_data.version.empty()) {
			return false;
		}
		for (const auto& record : a_data.lossHistory) {
			if (!IsValidLossRecord(record)) {
				return false;
			}
		}
		for (const auto& [id, lost] : a_data.lostCharacters) {
			if (IsBlank(id) || id != lost.characterId || !IsValidLostCharacter(lost)) {
				return false;
			}
		}
		return true;
	}

	bool IsConsistentChapterLossData(const ChapterLossData& a_data)
	{
		std::set<std::string> recorded;
		for (const auto& record : a_data.lossHistory) {
			recorded.insert(record.characterId);
		}
		if (recorded.size() != a_data.lostCharacters.size()) {
			return false;
		}
		return std::all_of(recorded.begin(), recorded.end(), [&](const std::string& a_id) {
			return a_data.lostCharacters.find(a_id) != a_data.lostCharacters.end();
		});
	}
}
