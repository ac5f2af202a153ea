#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ChapterLoss
{
	enum class DangerLevel : std::uint8_t
	{
		kNone = 0,
		kLow,
		kMedium,
		kHigh,
		kCritical
	};

	enum class LossCauseType : std::uint8_t
	{
		kBattleDefeat = 0,
		kCriticalDamage,
		kStatusEffect,
		kEnvironmental,
		kSacrifice
	};

	enum class StatusEffectType : std::uint8_t
	{
		kPoison = 0,
		kBurn,
		kFreeze,
		kCurse,
		kDrain
	};

	enum class Faction : std::uint8_t
	{
		kPlayer = 0,
		kEnemy,
		kNpc
	};

	struct Position
	{
		std::int32_t x{ 0 };
		std::int32_t y{ 0 };

		bool operator==(const Position&) const = default;
	};

	struct LossCause
	{
		LossCauseType type{ LossCauseType::kBattleDefeat };
		std::string description{};
		std::optional<std::string> sourceId{};
		std::optional<std::string> sourceName{};
		std::optional<double> damageAmount{};
		std::optional<StatusEffectType> statusType{};
		std::int64_t timestamp{ 0 };

		bool operator==(const LossCause&) const = default;
	};

	struct LostCharacter
	{
		std::string characterId{};
		std::string name{};
		std::int64_t lostAt{ 0 };
		std::int32_t turn{ 1 };
		LossCause cause{};
		std::int32_t level{ 1 };
		bool wasRecruited{ false };
		std::optional<Position> position{};

		bool operator==(const LostCharacter&) const = default;
	};

	struct LossRecord : LostCharacter
	{
		std::string chapterId{};
		std::string stageId{};
		bool recoverable{ false };

		bool operator==(const LossRecord&) const = default;
	};

	struct ChapterLossData
	{
		std::string chapterId{};
		std::map<std::string, LostCharacter> lostCharacters{};
		std::vector<LossRecord> lossHistory{};
		std::int64_t chapterStartTime{ 0 };
		std::string version{};

		bool operator==(const ChapterLossData&) const = default;
	};

	struct ChapterLossSummary
	{
		std::string chapterId{};
		std::string chapterName{};
		std::uint32_t totalCharacters{ 0 };
		std::vector<LostCharacter> lostCharacters{};
		std::vector<std::string> survivedCharacters{};
		std::int64_t chapterDuration{ 0 };
		std::int32_t totalTurns{ 0 };
		bool isPerfectClear{ true };
		std::int64_t completedAt{ 0 };
	};

	struct ChapterStats
	{
		double survivalRate{ 100.0 };
		std::int64_t averageTurnDuration{ 0 };
		double lossRate{ 0.0 };
	};

	// Roster entry tracked by the orchestrator. HP and position are owned by the game-state side;
	// this is a snapshot pushed in through InitializeChapter/OnUnitUpdated.
	struct Unit
	{
		std::string id{};
		std::string name{};
		Faction faction{ Faction::kPlayer };
		std::int32_t level{ 1 };
		std::int32_t currentHP{ 0 };
		std::int32_t maxHP{ 0 };
		std::optional<Position> position{};
		bool hasActed{ false };
		bool hasMoved{ false };
		bool wasRecruited{ false };
	};

	struct SuspendedUnitState
	{
		std::string id{};
		std::int32_t currentHP{ 0 };
		std::optional<Position> position{};
		bool hasActed{ false };
		bool hasMoved{ false };

		bool operator==(const SuspendedUnitState&) const = default;
	};

	// Tactical snapshot layered on top of the regular ledger while a chapter is suspended.
	struct SuspendRecord
	{
		std::string chapterId{};
		std::int64_t suspendedAt{ 0 };
		std::int32_t currentTurn{ 1 };
		std::uint32_t totalLosses{ 0 };
		std::map<std::string, DangerLevel> dangerLevels{};
		std::vector<SuspendedUnitState> units{};

		bool operator==(const SuspendRecord&) const = default;
	};

	struct DangerThresholds
	{
		std::int32_t criticalPercent{ 25 };
		std::int32_t highPercent{ 50 };
		std::int32_t mediumPercent{ 75 };
		std::int32_t lowPercent{ 90 };
	};

	inline constexpr std::string_view kSchemaVersion = "1.0.0";

	[[nodiscard]] constexpr DangerLevel CalculateDangerLevel(
		std::int32_t a_currentHP,
		std::int32_t a_maxHP,
		const DangerThresholds& a_thresholds = {}) noexcept
	{
		if (a_currentHP <= 0) {
			return DangerLevel::kCritical;
		}

		const std::int64_t maxHP = a_maxHP > 0 ? a_maxHP : a_currentHP;
		// Integer compare of hp/max <= pct/100.
		const std::int64_t scaled = static_cast<std::int64_t>(a_currentHP) * 100;
		if (scaled <= maxHP * a_thresholds.criticalPercent) {
			return DangerLevel::kCritical;
		}
		if (scaled <= maxHP * a_thresholds.highPercent) {
			return DangerLevel::kHigh;
		}
		if (scaled <= maxHP * a_thresholds.mediumPercent) {
			return DangerLevel::kMedium;
		}
		if (scaled <= maxHP * a_thresholds.lowPercent) {
			return DangerLevel::kLow;
		}
		return DangerLevel::kNone;
	}

	[[nodiscard]] constexpr std::string_view ToString(DangerLevel a_level) noexcept
	{
		switch (a_level) {
		case DangerLevel::kNone:
			return "none";
		case DangerLevel::kLow:
			return "low";
		case DangerLevel::kMedium:
			return "medium";
		case DangerLevel::kHigh:
			return "high";
		case DangerLevel::kCritical:
			return "critical";
		}
		return "none";
	}

	[[nodiscard]] constexpr std::string_view ToString(LossCauseType a_type) noexcept
	{
		switch (a_type) {
		case LossCauseType::kBattleDefeat:
			return "battle_defeat";
		case LossCauseType::kCriticalDamage:
			return "critical_damage";
		case LossCauseType::kStatusEffect:
			return "status_effect";
		case LossCauseType::kEnvironmental:
			return "environmental";
		case LossCauseType::kSacrifice:
			return "sacrifice";
		}
		return "battle_defeat";
	}

	[[nodiscard]] constexpr std::string_view ToString(StatusEffectType a_type) noexcept
	{
		switch (a_type) {
		case StatusEffectType::kPoison:
			return "poison";
		case StatusEffectType::kBurn:
			return "burn";
		case StatusEffectType::kFreeze:
			return "freeze";
		case StatusEffectType::kCurse:
			return "curse";
		case StatusEffectType::kDrain:
			return "drain";
		}
		return "poison";
	}

	[[nodiscard]] constexpr std::string_view ToString(Faction a_faction) noexcept
	{
		switch (a_faction) {
		case Faction::kPlayer:
			return "player";
		case Faction::kEnemy:
			return "enemy";
		case Faction::kNpc:
			return "npc";
		}
		return "player";
	}

	[[nodiscard]] constexpr std::optional<DangerLevel> ParseDangerLevel(std::string_view a_text) noexcept
	{
		for (const auto level : { DangerLevel::kNone, DangerLevel::kLow, DangerLevel::kMedium, DangerLevel::kHigh, DangerLevel::kCritical }) {
			if (ToString(level) == a_text) {
				return level;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<LossCauseType> ParseLossCauseType(std::string_view a_text) noexcept
	{
		for (const auto type : { LossCauseType::kBattleDefeat, LossCauseType::kCriticalDamage, LossCauseType::kStatusEffect, LossCauseType::kEnvironmental, LossCauseType::kSacrifice }) {
			if (ToString(type) == a_text) {
				return type;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<StatusEffectType> ParseStatusEffectType(std::string_view a_text) noexcept
	{
		for (const auto type : { StatusEffectType::kPoison, StatusEffectType::kBurn, StatusEffectType::kFreeze, StatusEffectType::kCurse, StatusEffectType::kDrain }) {
			if (ToString(type) == a_text) {
				return type;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr std::optional<Faction> ParseFaction(std::string_view a_text) noexcept
	{
		for (const auto faction : { Faction::kPlayer, Faction::kEnemy, Faction::kNpc }) {
			if (ToString(faction) == a_text) {
				return faction;
			}
		}
		return std::nullopt;
	}

	[[nodiscard]] constexpr bool IsBlank(std::string_view a_text) noexcept
	{
		for (const char c : a_text) {
			if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
				return false;
			}
		}
		return true;
	}

	// Wall clock in epoch milliseconds; every persisted timestamp uses this base.
	[[nodiscard]] std::int64_t NowEpochMs();

	[[nodiscard]] std::string MakeStageId(std::string_view a_chapterId, std::int32_t a_turn);
	[[nodiscard]] std::string MakeChapterName(std::string_view a_chapterId);
	[[nodiscard]] std::string MakeDefaultCharacterName(std::string_view a_characterId);

	// Cause factories. All stamp the current time.
	[[nodiscard]] LossCause MakeBattleDefeatCause(std::string_view a_attackerId, std::string_view a_attackerName, double a_damage);
	[[nodiscard]] LossCause MakeCriticalDamageCause(std::string_view a_attackerId, std::string_view a_attackerName, double a_damage);
	[[nodiscard]] LossCause MakeStatusEffectCause(StatusEffectType a_status, double a_damage);
	[[nodiscard]] LossCause MakeSkillDefeatCause(
		std::string_view a_casterId,
		std::string_view a_casterName,
		std::string_view a_skillId,
		double a_damage);
	[[nodiscard]] LossCause MakeEnvironmentalCause(std::string_view a_description);
	[[nodiscard]] LossCause MakeSacrificeCause(std::string_view a_description);

	[[nodiscard]] std::string FormatLossCauseDescription(const LossCause& a_cause);
	[[nodiscard]] ChapterStats CalculateChapterStats(const ChapterLossSummary& a_summary);
	[[nodiscard]] ChapterLossData CreateDefaultChapterLossData(std::string_view a_chapterId);
}
