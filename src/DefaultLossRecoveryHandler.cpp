#include "ChapterLoss/DefaultLossRecoveryHandler.h"
#include "ChapterLoss/LossContract.h"
#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/LossSerialization.h"

#include <algorithm>
#include <exception>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		constexpr std::int32_t kFallbackMaxHP = 100;

		[[nodiscard]] bool HasIssue(const std::vector<UnitIssue>& a_issues, UnitIssue a_issue)
		{
			return std::find(a_issues.begin(), a_issues.end(), a_issue) != a_issues.end();
		}
	}

	std::string_view ToString(UnitIssue a_issue) noexcept
	{
		switch (a_issue) {
		case UnitIssue::kMissingId:
			return "missing_id";
		case UnitIssue::kMissingName:
			return "missing_name";
		case UnitIssue::kInvalidCurrentHP:
			return "invalid_current_hp";
		case UnitIssue::kInvalidMaxHP:
			return "invalid_max_hp";
		case UnitIssue::kCurrentHPAboveMax:
			return "current_hp_above_max";
		case UnitIssue::kInvalidLevel:
			return "invalid_level";
		}
		return "unknown";
	}

	std::vector<UnitIssue> FindUnitIssues(const Unit& a_unit)
	{
		std::vector<UnitIssue> issues;
		if (IsBlank(a_unit.id)) {
			issues.push_back(UnitIssue::kMissingId);
		}
		if (IsBlank(a_unit.name)) {
			issues.push_back(UnitIssue::kMissingName);
		}
		if (a_unit.currentHP < 0) {
			issues.push_back(UnitIssue::kInvalidCurrentHP);
		}
		if (a_unit.maxHP <= 0) {
			issues.push_back(UnitIssue::kInvalidMaxHP);
		} else if (a_unit.currentHP > a_unit.maxHP) {
			issues.push_back(UnitIssue::kCurrentHPAboveMax);
		}
		if (a_unit.level < 1) {
			issues.push_back(UnitIssue::kInvalidLevel);
		}
		return issues;
	}

	std::optional<Unit> DefaultLossRecoveryHandler::RepairUnit(const Unit& a_unit)
	{
		const auto issues = FindUnitIssues(a_unit);
		if (issues.empty()) {
			return a_unit;
		}

		Unit repaired = a_unit;
		if (HasIssue(issues, UnitIssue::kMissingId)) {
			repaired.id = fmt::format("repaired_character_{}", NowEpochMs());
		}
		if (HasIssue(issues, UnitIssue::kMissingName)) {
			repaired.name = MakeDefaultCharacterName(repaired.id);
		}
		if (HasIssue(issues, UnitIssue::kInvalidCurrentHP)) {
			repaired.currentHP = std::max(0, repaired.maxHP > 0 ? repaired.maxHP : kFallbackMaxHP);
		}
		if (HasIssue(issues, UnitIssue::kInvalidMaxHP)) {
			repaired.maxHP = std::max(repaired.currentHP, kFallbackMaxHP);
		}
		repaired.currentHP = std::min(repaired.currentHP, repaired.maxHP);
		if (HasIssue(issues, UnitIssue::kInvalidLevel)) {
			repaired.level = 1;
		}

		if (!FindUnitIssues(repaired).empty()) {
			spdlog::warn("ChapterLoss: unit data could not be repaired.");
			return std::nullopt;
		}

		spdlog::warn(
			"ChapterLoss: repaired unit {} ({} issue(s), first: {}).",
			repaired.id,
			issues.size(),
			ToString(issues.front()));
		return repaired;
	}

	std::optional<ChapterLossData> DefaultLossRecoveryHandler::RepairSaveData(
		std::string_view a_chapterId,
		std::string_view a_payload)
	{
		if (a_payload.empty()) {
			return std::nullopt;
		}

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(a_payload.begin(), a_payload.end());
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: save data for {} is not repairable ({}).", a_chapterId, e.what());
			return std::nullopt;
		}

		if (!j.is_object()) {
			return std::nullopt;
		}
		const auto idIt = j.find(std::string(LossContract::kFieldChapterId));
		if (idIt == j.end() || !idIt->is_string() || idIt->get<std::string>() != a_chapterId) {
			spdlog::warn("ChapterLoss: save data does not belong to chapter {}; not repairing.", a_chapterId);
			return std::nullopt;
		}

		const ChapterLossData salvaged = LossSerialization::SanitizeChapterLossData(j, a_chapterId);

		// Run the salvaged entries through a scratch ledger so the lost map and history agree again.
		try {
			LossRecordStore scratch;
			scratch.Deserialize(salvaged);
			const auto report = scratch.ValidateAndRepair();
			if (!report.isValid) {
				return std::nullopt;
			}
			spdlog::warn(
				"ChapterLoss: salvaged save data for {} ({} loss(es) kept, {} repair(s)).",
				a_chapterId,
				scratch.GetTotalLosses(),
				report.repaired.size());
			return scratch.Serialize();
		} catch (const LossError& e) {
			spdlog::warn("ChapterLoss: salvaged save data for {} is still invalid ({}).", a_chapterId, e.what());
			return std::nullopt;
		}
	}
}
