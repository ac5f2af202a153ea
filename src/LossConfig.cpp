#include "ChapterLoss/LossConfig.h"

#include <algorithm>
#include <exception>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		constexpr std::uint32_t kPartySizeCap = 64;
		constexpr std::uint32_t kSuggestionCap = 64;

		[[nodiscard]] std::uint32_t ReadCount(const nlohmann::json& a_section, const char* a_key, std::uint32_t a_fallback, std::uint32_t a_max)
		{
			const double raw = a_section.value(a_key, static_cast<double>(a_fallback));
			if (raw <= 0.0) {
				return 0u;
			}
			return static_cast<std::uint32_t>(std::clamp(raw, 0.0, static_cast<double>(a_max)));
		}
	}

	bool LoadLossConfig(const std::filesystem::path& a_path, LossConfig& a_out)
	{
		spdlog::info("ChapterLoss: loading config from: {}", a_path.string());

		std::ifstream in(a_path);
		if (!in.is_open()) {
			spdlog::warn("ChapterLoss: config not found: {}", a_path.string());
			return false;
		}

		nlohmann::json j;
		try {
			in >> j;
		} catch (const std::exception&) {
			spdlog::error("ChapterLoss: failed to parse config ({}).", a_path.string());
			return false;
		}
		if (!j.is_object()) {
			spdlog::error("ChapterLoss: config root must be an object ({}).", a_path.string());
			return false;
		}

		LossConfig config = a_out;

		try {
			const auto& orchestrator = j.value("orchestrator", nlohmann::json::object());
			if (orchestrator.is_object()) {
				auto& o = config.orchestrator;
				o.enableAutoLossProcessing = orchestrator.value("enableAutoLossProcessing", o.enableAutoLossProcessing);
				o.enableDangerWarnings = orchestrator.value("enableDangerWarnings", o.enableDangerWarnings);
				o.criticalHPThreshold = orchestrator.value("criticalHPThreshold", o.criticalHPThreshold);
				o.highHPThreshold = orchestrator.value("highHPThreshold", o.highHPThreshold);
				o.enableRecruitmentIntegration = orchestrator.value("enableRecruitmentIntegration", o.enableRecruitmentIntegration);
				o.enableLossLogging = orchestrator.value("enableLossLogging", o.enableLossLogging);
				o.skipPresentation = orchestrator.value("skipPresentation", o.skipPresentation);
				o.performanceWarningMs = orchestrator.value("performanceWarningMs", o.performanceWarningMs);

				o.criticalHPThreshold = std::clamp(o.criticalHPThreshold, 0, 100);
				o.highHPThreshold = std::clamp(o.highHPThreshold, o.criticalHPThreshold, 100);
				o.performanceWarningMs = std::clamp(o.performanceWarningMs, 1.0, 60000.0);
			}

			const auto& party = j.value("party", nlohmann::json::object());
			if (party.is_object()) {
				auto& p = config.party;
				p.maxPartySize = ReadCount(party, "maxPartySize", p.maxPartySize, kPartySizeCap);
				if (p.maxPartySize == 0u) {
					p.maxPartySize = 1u;
				}
				p.minPartySize = std::min(ReadCount(party, "minPartySize", p.minPartySize, kPartySizeCap), p.maxPartySize);
				p.allowEmptyParty = party.value("allowEmptyParty", p.allowEmptyParty);
				p.lowLevelThreshold = std::clamp(party.value("lowLevelThreshold", p.lowLevelThreshold), 1, 999);
				p.levelVarianceThreshold = std::clamp(party.value("levelVarianceThreshold", p.levelVarianceThreshold), 0.0, 1.0e6);
				p.maxSuggestions = ReadCount(party, "maxSuggestions", p.maxSuggestions, kSuggestionCap);
			}

			const auto& storage = j.value("storage", nlohmann::json::object());
			if (storage.is_object()) {
				config.storage.directory = storage.value("directory", config.storage.directory);
				if (config.storage.directory.empty()) {
					config.storage.directory = StorageConfig{}.directory;
				}
			}

			const auto& logging = j.value("logging", nlohmann::json::object());
			if (logging.is_object()) {
				config.logging.file = logging.value("file", config.logging.file);
				config.logging.level = logging.value("level", config.logging.level);
			}
		} catch (const std::exception& e) {
			// value() throws on a type mismatch (e.g. a string where a number belongs).
			spdlog::error("ChapterLoss: invalid config value in {} ({}).", a_path.string(), e.what());
			return false;
		}

		a_out = std::move(config);
		return true;
	}
}
