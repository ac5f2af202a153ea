#include <cstdio>
#include <exception>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "ChapterLoss/DefaultLossRecoveryHandler.h"
#include "ChapterLoss/KeyValueStore.h"
#include "ChapterLoss/LossConfig.h"
#include "ChapterLoss/LossLogging.h"
#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/PersistenceGateway.h"

namespace
{
	using namespace ChapterLoss;

	void PrintUsage()
	{
		fmt::print(
			stderr,
			"usage: chapterloss [--config <file>] <command> <chapter>\n"
			"  info <chapter>     save metadata\n"
			"  summary <chapter>  loss summary and stats\n"
			"  export <chapter>   ledger as pretty JSON\n"
			"  repair <chapter>   load through recovery, repair and re-save\n"
			"  clear <chapter>    remove saves and suspend record\n");
	}

	// Loads the chapter ledger into a fresh store. Returns false with the reason printed.
	bool LoadInto(PersistenceGateway& a_gateway, std::string_view a_chapterId, LossRecordStore& a_store)
	{
		const auto loaded = a_gateway.Load(a_chapterId);
		if (!loaded.success) {
			fmt::print(stderr, "chapterloss: {}\n", loaded.message);
			return false;
		}
		if (loaded.wasEmpty || !loaded.data) {
			fmt::print(stderr, "chapterloss: no saved data for chapter {}\n", a_chapterId);
			return false;
		}
		if (loaded.source != LoadSource::kPrimary) {
			fmt::print(stderr, "chapterloss: loaded via {}: {}\n", ToString(loaded.source), loaded.message);
		}

		try {
			a_store.Deserialize(*loaded.data);
		} catch (const LossError& e) {
			fmt::print(stderr, "chapterloss: {}\n", e.what());
			return false;
		}
		return true;
	}

	int RunInfo(PersistenceGateway& a_gateway, std::string_view a_chapterId)
	{
		const auto info = a_gateway.GetSaveDataInfo(a_chapterId);
		if (!info) {
			fmt::print(stderr, "chapterloss: no readable save data for chapter {}\n", a_chapterId);
			return 1;
		}
		fmt::print(
			"chapter:    {}\nlosses:     {}\nstarted at: {}\nsize:       {} bytes\nbackup:     {}\nsuspended:  {}\n",
			info->chapterId,
			info->lossCount,
			info->lastSaved,
			info->dataSize,
			info->hasBackup ? "yes" : "no",
			a_gateway.HasSuspendRecord(a_chapterId) ? "yes" : "no");
		return 0;
	}

	int RunSummary(PersistenceGateway& a_gateway, std::string_view a_chapterId)
	{
		LossRecordStore store;
		if (!LoadInto(a_gateway, a_chapterId, store)) {
			return 1;
		}

		ChapterLossSummary summary{};
		try {
			summary = store.GetChapterSummary();
		} catch (const LossError& e) {
			fmt::print(stderr, "chapterloss: {}\n", e.what());
			return 1;
		}

		const auto stats = CalculateChapterStats(summary);
		fmt::print(
			"{} ({})\ncharacters: {}  lost: {}  turns: {}  perfect: {}\nsurvival: {:.1f}%  loss rate: {:.1f}%\n",
			summary.chapterName,
			summary.chapterId,
			summary.totalCharacters,
			summary.lostCharacters.size(),
			summary.totalTurns,
			summary.isPerfectClear ? "yes" : "no",
			stats.survivalRate,
			stats.lossRate);
		for (const auto& lost : summary.lostCharacters) {
			fmt::print("  turn {:>3}  {} ({}): {}\n", lost.turn, lost.name, lost.characterId, FormatLossCauseDescription(lost.cause));
		}
		return 0;
	}

	int RunExport(PersistenceGateway& a_gateway, std::string_view a_chapterId)
	{
		LossRecordStore store;
		if (!LoadInto(a_gateway, a_chapterId, store)) {
			return 1;
		}
		fmt::print("{}\n", store.ExportState());
		return 0;
	}

	int RunRepair(PersistenceGateway& a_gateway, std::string_view a_chapterId)
	{
		LossRecordStore store;
		if (!LoadInto(a_gateway, a_chapterId, store)) {
			return 1;
		}

		const auto report = store.ValidateAndRepair();
		for (const auto& note : report.repaired) {
			fmt::print("repaired: {}\n", note);
		}
		for (const auto& warning : report.warnings) {
			fmt::print("warning:  {}\n", warning);
		}

		const auto saved = a_gateway.Save(a_chapterId, store.Serialize());
		if (!saved.success) {
			fmt::print(stderr, "chapterloss: {}\n", saved.message);
			return 1;
		}
		fmt::print("chapter {} saved ({} losses, {} bytes)\n", a_chapterId, store.GetTotalLosses(), saved.dataSize);
		return 0;
	}

	int RunClear(PersistenceGateway& a_gateway, std::string_view a_chapterId)
	{
		const bool savesCleared = a_gateway.Remove(a_chapterId);
		const bool suspendCleared = a_gateway.RemoveSuspendRecord(a_chapterId);
		if (!savesCleared || !suspendCleared) {
			fmt::print(stderr, "chapterloss: failed to clear data for chapter {}\n", a_chapterId);
			return 1;
		}
		fmt::print("chapter {} cleared\n", a_chapterId);
		return 0;
	}
}

int main(int argc, char** argv)
{
	std::vector<std::string_view> args(argv + 1, argv + argc);
	std::filesystem::path configPath{ std::string(ChapterLoss::kDefaultConfigFileName) };
	if (args.size() >= 2 && args[0] == "--config") {
		configPath = std::filesystem::path(std::string(args[1]));
		args.erase(args.begin(), args.begin() + 2);
	}
	if (args.size() != 2 || ChapterLoss::IsBlank(args[1])) {
		PrintUsage();
		return 2;
	}

	ChapterLoss::LossConfig config{};
	if (!ChapterLoss::LoadLossConfig(configPath, config)) {
		fmt::print(stderr, "chapterloss: using default configuration ({} not loaded)\n", configPath.string());
	}
	if (!ChapterLoss::Logging::Setup(config.logging.file, ChapterLoss::Logging::ParseLevel(config.logging.level))) {
		fmt::print(stderr, "chapterloss: logging to {} unavailable\n", config.logging.file);
	}

	try {
		ChapterLoss::FileKeyValueStore storage(config.storage.directory);
		ChapterLoss::DefaultLossRecoveryHandler recovery;
		ChapterLoss::PersistenceGateway gateway(storage, &recovery);

		const auto command = args[0];
		const auto chapterId = args[1];
		if (command == "info") {
			return RunInfo(gateway, chapterId);
		}
		if (command == "summary") {
			return RunSummary(gateway, chapterId);
		}
		if (command == "export") {
			return RunExport(gateway, chapterId);
		}
		if (command == "repair") {
			return RunRepair(gateway, chapterId);
		}
		if (command == "clear") {
			return RunClear(gateway, chapterId);
		}
	} catch (const std::exception& e) {
		spdlog::error("ChapterLoss: command failed ({}).", e.what());
		fmt::print(stderr, "chapterloss: {}\n", e.what());
		return 1;
	}

	PrintUsage();
	return 2;
}
