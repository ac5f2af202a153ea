#include "loss_runtime_checks_common.h"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

namespace LossRuntimeChecks
{
	namespace
	{
		namespace fs = std::filesystem;

		fs::path MakeScratchDir(std::string_view a_tag)
		{
			const auto dir = fs::temp_directory_path() / fmt::format("chapterloss_{}_{}", a_tag, NowEpochMs());
			std::error_code ec;
			fs::remove_all(dir, ec);
			fs::create_directories(dir, ec);
			return dir;
		}

		void WriteFile(const fs::path& a_path, std::string_view a_text)
		{
			std::ofstream out(a_path, std::ios::binary | std::ios::trunc);
			out << a_text;
		}

		std::string ReadFile(const fs::path& a_path)
		{
			std::ifstream in(a_path, std::ios::binary);
			std::ostringstream buffer;
			buffer << in.rdbuf();
			return buffer.str();
		}
	}

	bool CheckConfigLoading()
	{
		const auto dir = MakeScratchDir("config");
		bool ok = true;

		LossConfig config{};
		if (LoadLossConfig(dir / "missing.json", config)) {
			std::cerr << "config: missing file should report failure\n";
			ok = false;
		}

		const auto path = dir / std::string(kDefaultConfigFileName);
		WriteFile(path, R"({
			"orchestrator": {
				"enableDangerWarnings": false,
				"criticalHPThreshold": 30,
				"highHPThreshold": 20,
				"performanceWarningMs": 0
			},
			"party": { "maxPartySize": 4, "minPartySize": 9 },
			"storage": { "directory": "" },
			"logging": { "level": "debug" }
		})");

		if (ok && !LoadLossConfig(path, config)) {
			std::cerr << "config: valid file should load\n";
			ok = false;
		}
		if (ok) {
			const auto& o = config.orchestrator;
			if (o.enableDangerWarnings || o.criticalHPThreshold != 30 || o.highHPThreshold != 30 || o.performanceWarningMs != 1.0) {
				std::cerr << "config: orchestrator values should be clamped into range\n";
				ok = false;
			}
			if (!o.enableAutoLossProcessing || !o.enableRecruitmentIntegration) {
				std::cerr << "config: absent keys should keep their defaults\n";
				ok = false;
			}
		}
		if (ok && (config.party.maxPartySize != 4u || config.party.minPartySize != 4u || config.party.maxSuggestions != 5u)) {
			std::cerr << "config: minimum party size should not exceed the maximum\n";
			ok = false;
		}
		if (ok && (config.storage.directory != "saves" || config.logging.level != "debug" || config.logging.file != "chapter_loss.log")) {
			std::cerr << "config: storage and logging sections mismatch\n";
			ok = false;
		}

		if (ok) {
			const auto thresholds = MakeDangerThresholds(config.orchestrator);
			if (thresholds.criticalPercent != 30 || thresholds.highPercent != 30 || thresholds.mediumPercent != 75) {
				std::cerr << "config: danger thresholds should follow the configured bands\n";
				ok = false;
			}
		}

		if (ok) {
			LossConfig untouched{};
			untouched.party.maxPartySize = 9;
			WriteFile(path, R"({ "orchestrator": { "criticalHPThreshold": "high" } })");
			if (LoadLossConfig(path, untouched) || untouched.party.maxPartySize != 9u) {
				std::cerr << "config: wrongly typed value should fail without touching the output\n";
				ok = false;
			}

			WriteFile(path, "{ not json");
			if (LoadLossConfig(path, untouched) || untouched.party.maxPartySize != 9u) {
				std::cerr << "config: unparsable file should fail without touching the output\n";
				ok = false;
			}

			WriteFile(path, "[1, 2]");
			if (LoadLossConfig(path, untouched)) {
				std::cerr << "config: non-object root should be refused\n";
				ok = false;
			}
		}

		std::error_code ec;
		fs::remove_all(dir, ec);
		return ok;
	}

	bool CheckEventBus()
	{
		LossEventBus bus;
		std::vector<std::string> seen;

		const auto first = bus.Subscribe<ChapterSuspendedEvent>([&](const ChapterSuspendedEvent&) {
			seen.push_back("first");
			throw std::runtime_error("handler failure");
		});
		const auto second = bus.Subscribe<ChapterSuspendedEvent>([&](const ChapterSuspendedEvent& a_event) {
			seen.push_back("second:" + a_event.chapterId);
		});
		(void)bus.Subscribe<ChapterResumedEvent>([&](const ChapterResumedEvent&) { seen.push_back("resumed"); });

		if (first == second || bus.SubscriberCount<ChapterSuspendedEvent>() != 2u || bus.SubscriberCount<GameOverEvent>() != 0u) {
			std::cerr << "event_bus: subscriptions should be counted per event type\n";
			return false;
		}

		ChapterSuspendedEvent suspended{};
		suspended.chapterId = "ch1";
		bus.Publish(suspended);
		if (seen != std::vector<std::string>{ "first", "second:ch1" }) {
			std::cerr << "event_bus: a throwing handler must not stop later handlers\n";
			return false;
		}

		if (!bus.Unsubscribe(first) || bus.Unsubscribe(first) || bus.SubscriberCount<ChapterSuspendedEvent>() != 1u) {
			std::cerr << "event_bus: unsubscribe should remove a handler exactly once\n";
			return false;
		}

		seen.clear();
		bus.Publish(suspended);
		bus.Publish(ChapterResumedEvent{});
		if (seen != std::vector<std::string>{ "second:ch1", "resumed" }) {
			std::cerr << "event_bus: only remaining handlers should run\n";
			return false;
		}

		bus.Clear();
		seen.clear();
		bus.Publish(suspended);
		if (!seen.empty() || bus.SubscriberCount<ChapterResumedEvent>() != 0u) {
			std::cerr << "event_bus: clear should drop every handler\n";
			return false;
		}
		return true;
	}

	bool CheckLoggingLevels()
	{
		if (Logging::ParseLevel("debug") != spdlog::level::debug || Logging::ParseLevel("warning") != spdlog::level::warn ||
			Logging::ParseLevel("off") != spdlog::level::off) {
			std::cerr << "logging: known level names should parse\n";
			return false;
		}
		if (Logging::ParseLevel("bogus", spdlog::level::warn) != spdlog::level::warn || Logging::ParseLevel("") != spdlog::level::info) {
			std::cerr << "logging: unknown level names should use the fallback\n";
			return false;
		}

		const auto dir = MakeScratchDir("logging");
		bool ok = true;

		WriteFile(dir / "blocker", "file");
		if (Logging::Setup(dir / "blocker" / "chapter_loss.log", spdlog::level::info)) {
			std::cerr << "logging: setup should fail when the log directory cannot be created\n";
			ok = false;
		}

		const auto logPath = dir / "logs" / "chapter_loss.log";
		if (ok && !Logging::Setup(logPath, spdlog::level::info)) {
			std::cerr << "logging: setup should create the log file\n";
			ok = false;
		}
		if (ok) {
			spdlog::debug("ChapterLoss: hidden below the configured level");
			spdlog::info("ChapterLoss: logging check line");
			spdlog::default_logger()->flush();

			const auto text = ReadFile(logPath);
			if (text.find("[info] ChapterLoss: logging check line") == std::string::npos ||
				text.find("hidden below the configured level") != std::string::npos) {
				std::cerr << "logging: file should hold formatted lines at or above the level\n";
				ok = false;
			}
		}

		std::error_code ec;
		fs::remove_all(dir, ec);
		return ok;
	}
}
