#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ChapterLoss/LossCollaborators.h"

namespace ChapterLoss
{
	enum class UnitIssue : std::uint8_t
	{
		kMissingId = 0,
		kMissingName,
		kInvalidCurrentHP,
		kInvalidMaxHP,
		kCurrentHPAboveMax,
		kInvalidLevel
	};

	[[nodiscard]] std::string_view ToString(UnitIssue a_issue) noexcept;

	[[nodiscard]] std::vector<UnitIssue> FindUnitIssues(const Unit& a_unit);

	// Field-level repair of units plus salvage of damaged save blobs. Save blobs are only
	// salvaged when they still parse as an object for the requested chapter; anything worse is
	// left to the backup and reset tiers.
	class DefaultLossRecoveryHandler final : public ILossRecoveryHandler
	{
	public:
		[[nodiscard]] std::optional<Unit> RepairUnit(const Unit& a_unit) override;
		[[nodiscard]] std::optional<ChapterLossData> RepairSaveData(
			std::string_view a_chapterId,
			std::string_view a_payload) override;
	};
}
