#pragma once

#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss::Validation
{
	[[nodiscard]] bool IsValidLossCause(const LossCause& a_cause);
	[[nodiscard]] bool IsValidLostCharacter(const LostCharacter& a_lost);
	[[nodiscard]] bool IsValidLossRecord(const LossRecord& a_record);
	[[nodiscard]] bool IsValidChapterLossSummary(const ChapterLossSummary& a_summary);
	[[nodiscard]] bool IsValidChapterLossData(const ChapterLossData& a_data);

	// Lost map and history name the same characters.
	[[nodiscard]] bool IsConsistentChapterLossData(const ChapterLossData& a_data);
}
