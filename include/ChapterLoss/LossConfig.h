#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss
{
	inline constexpr std::string_view kDefaultConfigFileName = "chapter_loss.json";

	struct OrchestratorConfig
	{
		bool enableAutoLossProcessing{ true };
		bool enableDangerWarnings{ true };
		std::int32_t criticalHPThreshold{ 25 };
		std::int32_t highHPThreshold{ 50 };
		bool enableRecruitmentIntegration{ true };
		bool enableLossLogging{ true };
		bool skipPresentation{ false };
		double performanceWarningMs{ 100.0 };
	};

	struct PartyRules
	{
		std::uint32_t minPartySize{ 1 };
		std::uint32_t maxPartySize{ 6 };
		bool allowEmptyParty{ false };
		std::int32_t lowLevelThreshold{ 5 };
		double levelVarianceThreshold{ 25.0 };
		std::uint32_t maxSuggestions{ 5 };
	};

	struct StorageConfig
	{
		std::string directory{ "saves" };
	};

	struct LoggingConfig
	{
		std::string file{ "chapter_loss.log" };
		std::string level{ "info" };
	};

	struct LossConfig
	{
		OrchestratorConfig orchestrator{};
		PartyRules party{};
		StorageConfig storage{};
		LoggingConfig logging{};
	};

	// Keeps the defaults already in a_out for every missing key. Returns false (a_out untouched)
	// when the file is missing or unparsable.
	bool LoadLossConfig(const std::filesystem::path& a_path, LossConfig& a_out);

	// Medium/low bands stay at 75/90 unless the configured high band already reaches past them.
	[[nodiscard]] constexpr DangerThresholds MakeDangerThresholds(const OrchestratorConfig& a_config) noexcept
	{
		DangerThresholds thresholds{};
		thresholds.criticalPercent = a_config.criticalHPThreshold;
		thresholds.highPercent = a_config.highHPThreshold;
		if (thresholds.mediumPercent < thresholds.highPercent) {
			thresholds.mediumPercent = thresholds.highPercent;
		}
		if (thresholds.lowPercent < thresholds.mediumPercent) {
			thresholds.lowPercent = thresholds.mediumPercent;
		}
		return thresholds;
	}
}
