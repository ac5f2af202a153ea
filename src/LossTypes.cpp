#include "ChapterLoss/LossTypes.h"

#include <chrono>
#include <cmath>

#include <fmt/format.h>

namespace ChapterLoss
{
	namespace
	{
		[[nodiscard]] double RoundTo2(double a_value)
		{
			return std::round(a_value * 100.0) / 100.0;
		}
	}

	std::int64_t NowEpochMs()
	{
		const auto now = std::chrono::system_clock::now();
		return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
	}

	std::string MakeStageId(std::string_view a_chapterId, std::int32_t a_turn)
	{
		return fmt::format("{}_stage_{}", a_chapterId, a_turn);
	}

	std::string MakeChapterName(std::string_view a_chapterId)
	{
		return fmt::format("Chapter {}", a_chapterId);
	}

	std::string MakeDefaultCharacterName(std::string_view a_characterId)
	{
		return fmt::format("Character {}", a_characterId);
	}

	LossCause MakeBattleDefeatCause(std::string_view a_attackerId, std::string_view a_attackerName, double a_damage)
	{
		LossCause cause{};
		cause.type = LossCauseType::kBattleDefeat;
		cause.sourceId = std::string(a_attackerId);
		cause.sourceName = std::string(a_attackerName);
		cause.damageAmount = a_damage;
		cause.description = fmt::format("Defeated by {}'s attack", a_attackerName);
		cause.timestamp = NowEpochMs();
		return cause;
	}

	LossCause MakeCriticalDamageCause(std::string_view a_attackerId, std::string_view a_attackerName, double a_damage)
	{
		LossCause cause{};
		cause.type = LossCauseType::kCriticalDamage;
		cause.sourceId = std::string(a_attackerId);
		cause.sourceName = std::string(a_attackerName);
		cause.damageAmount = a_damage;
		cause.description = fmt::format("Defeated by {}'s critical attack", a_attackerName);
		cause.timestamp = NowEpochMs();
		return cause;
	}

	LossCause MakeStatusEffectCause(StatusEffectType a_status, double a_damage)
	{
		LossCause cause{};
		cause.type = LossCauseType::kStatusEffect;
		cause.statusType = a_status;
		cause.damageAmount = a_damage;
		cause.description = fmt::format("Succumbed to {}", ToString(a_status));
		cause.timestamp = NowEpochMs();
		return cause;
	}

	LossCause MakeSkillDefeatCause(
		std::string_view a_casterId,
		std::string_view a_casterName,
		std::string_view a_skillId,
		double a_damage)
	{
		LossCause cause{};
		cause.type = LossCauseType::kBattleDefeat;
		cause.sourceId = std::string(a_casterId);
		cause.sourceName = std::string(a_casterName);
		cause.damageAmount = a_damage;
		cause.description = fmt::format("Defeated by {}'s skill \"{}\"", a_casterName, a_skillId);
		cause.timestamp = NowEpochMs();
		return cause;
	}

	LossCause MakeEnvironmentalCause(std::string_view a_description)
	{
		LossCause cause{};
		cause.type = LossCauseType::kEnvironmental;
		cause.description = a_description.empty() ? std::string("Defeated by environmental damage") : std::string(a_description);
		cause.timestamp = NowEpochMs();
		return cause;
	}

	LossCause MakeSacrificeCause(std::string_view a_description)
	{
		LossCause cause{};
		cause.type = LossCauseType::kSacrifice;
		cause.description = a_description.empty() ? std::string("Fell in self-sacrifice") : std::string(a_description);
		cause.timestamp = NowEpochMs();
		return cause;
	}

	std::string FormatLossCauseDescription(const LossCause& a_cause)
	{
		switch (a_cause.type) {
		case LossCauseType::kBattleDefeat:
			return a_cause.sourceName ? fmt::format("Defeated by {}'s attack", *a_cause.sourceName) : std::string("Defeated in battle");
		case LossCauseType::kCriticalDamage:
			return a_cause.sourceName ? fmt::format("Defeated by {}'s critical attack", *a_cause.sourceName) : std::string("Defeated by a critical attack");
		case LossCauseType::kStatusEffect:
			return a_cause.statusType ? fmt::format("Defeated by status effect ({})", ToString(*a_cause.statusType)) : std::string("Defeated by a status effect");
		case LossCauseType::kEnvironmental:
			return "Defeated by environmental damage";
		case LossCauseType::kSacrifice:
			return "Fell in self-sacrifice";
		}
		return a_cause.description.empty() ? std::string("Defeated by unknown causes") : a_cause.description;
	}

	ChapterStats CalculateChapterStats(const ChapterLossSummary& a_summary)
	{
		ChapterStats stats{};
		const auto lost = static_cast<double>(a_summary.lostCharacters.size());
		if (a_summary.totalCharacters > 0) {
			const auto total = static_cast<double>(a_summary.totalCharacters);
			stats.survivalRate = RoundTo2((total - lost) / total * 100.0);
			stats.lossRate = RoundTo2(lost / total * 100.0);
		}
		if (a_summary.totalTurns > 0) {
			stats.averageTurnDuration = static_cast<std::int64_t>(
				std::llround(static_cast<double>(a_summary.chapterDuration) / static_cast<double>(a_summary.totalTurns)));
		}
		return stats;
	}

	ChapterLossData CreateDefaultChapterLossData(std::string_view a_chapterId)
	{
		ChapterLossData data{};
		data.chapterId = std::string(a_chapterId);
		data.chapterStartTime = NowEpochMs();
		data.version = std::string(kSchemaVersion);
		return data;
	}
}
