#include "loss_runtime_checks_common.h"

namespace LossRuntimeChecks
{
	bool CheckStoreRecordLossIdempotence()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		store.AddParticipatingCharacter("A");

		const auto unit = MakeUnit("A", "Alice");
		const auto first = store.RecordLoss(unit, MakeCause());
		const auto second = store.RecordLoss(unit, MakeSacrificeCause(""));

		if (!(first == second)) {
			std::cerr << "store_idempotence: repeated loss should return the original record\n";
			return false;
		}
		if (second.cause.type != LossCauseType::kBattleDefeat) {
			std::cerr << "store_idempotence: original cause should be kept\n";
			return false;
		}
		if (store.GetTotalLosses() != 1u || store.GetLossHistory().size() != 1u) {
			std::cerr << "store_idempotence: expected exactly one loss and one history record\n";
			return false;
		}
		if (first.lostAt < store.GetChapterStartTime()) {
			std::cerr << "store_idempotence: loss must not predate chapter start\n";
			return false;
		}
		const auto history = store.GetLossHistory();
		if (history.front().chapterId != "ch1" || history.front().stageId != "ch1_stage_1" || history.front().recoverable) {
			std::cerr << "store_idempotence: history record should carry chapter, stage and recoverable=false\n";
			return false;
		}
		return true;
	}

	bool CheckStoreRejectsInvalidInput()
	{
		LossRecordStore store;
		try {
			(void)store.RecordLoss(MakeUnit("A", "Alice"), MakeCause());
			std::cerr << "store_rejects: recording before initialization should throw\n";
			return false;
		} catch (const LossError& e) {
			if (e.Kind() != LossErrorKind::kChapterNotInitialized) {
				std::cerr << "store_rejects: expected chapter_not_initialized\n";
				return false;
			}
		}

		try {
			store.InitializeChapter("   ");
			std::cerr << "store_rejects: blank chapter id should throw\n";
			return false;
		} catch (const LossError&) {
		}

		store.InitializeChapter("ch1");
		try {
			(void)store.RecordLoss(MakeUnit("", "Nobody"), MakeCause());
			std::cerr << "store_rejects: blank character id should throw\n";
			return false;
		} catch (const LossError& e) {
			if (e.Kind() != LossErrorKind::kInvalidCharacter) {
				std::cerr << "store_rejects: expected invalid_character\n";
				return false;
			}
		}

		LossCause badCause = MakeCause();
		badCause.timestamp = 0;
		try {
			(void)store.RecordLoss(MakeUnit("A", "Alice"), badCause);
			std::cerr << "store_rejects: cause without timestamp should throw\n";
			return false;
		} catch (const LossError& e) {
			if (e.Kind() != LossErrorKind::kInvalidLossCause || e.Details().context.characterId != "A") {
				std::cerr << "store_rejects: expected invalid_loss_cause with character context\n";
				return false;
			}
		}

		LossCause negativeDamage = MakeCause();
		negativeDamage.damageAmount = -1.0;
		try {
			(void)store.RecordLoss(MakeUnit("A", "Alice"), negativeDamage);
			std::cerr << "store_rejects: negative damage should throw\n";
			return false;
		} catch (const LossError&) {
		}

		if (store.GetTotalLosses() != 0u) {
			std::cerr << "store_rejects: rejected losses must not be recorded\n";
			return false;
		}
		return true;
	}

	bool CheckStoreTurnMonotonicity()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		store.SetCurrentTurn(3);
		const auto a = store.RecordLoss(MakeUnit("A", "Alice"), MakeCause());

		store.SetCurrentTurn(0);
		if (store.GetCurrentTurn() != 3) {
			std::cerr << "store_turns: turns below 1 should be ignored\n";
			return false;
		}

		store.SetCurrentTurn(2);
		const auto b = store.RecordLoss(MakeUnit("B", "Bob"), MakeCause());
		if (a.turn != 3 || b.turn < a.turn) {
			std::cerr << "store_turns: later losses must never get an earlier turn\n";
			return false;
		}
		if (b.lostAt < a.lostAt) {
			std::cerr << "store_turns: lostAt should not go backwards\n";
			return false;
		}

		const auto lost = store.GetLostCharacters();
		if (lost.size() != 2u || lost[0].characterId != "A" || lost[1].characterId != "B") {
			std::cerr << "store_turns: lost characters should be listed in loss order\n";
			return false;
		}
		return true;
	}

	bool CheckStoreSummaryAndStatistics()
	{
		LossRecordStore store;
		try {
			(void)store.GetChapterSummary();
			std::cerr << "store_summary: summary before initialization should throw\n";
			return false;
		} catch (const LossError&) {
		}

		store.InitializeChapter("ch7");
		for (const auto* id : { "A", "B", "C", "D" }) {
			store.AddParticipatingCharacter(id);
		}
		store.SetCurrentTurn(2);
		(void)store.RecordLoss(MakeUnit("A", ""), MakeCause());

		const auto summary = store.GetChapterSummary();
		if (summary.chapterName != "Chapter ch7" || summary.totalCharacters != 4u || summary.isPerfectClear) {
			std::cerr << "store_summary: unexpected summary header\n";
			return false;
		}
		if (summary.lostCharacters.size() != 1u || summary.lostCharacters.front().name != "Character A") {
			std::cerr << "store_summary: unnamed unit should get a default name\n";
			return false;
		}
		if (summary.survivedCharacters.size() != 3u ||
			std::find(summary.survivedCharacters.begin(), summary.survivedCharacters.end(), "A") != summary.survivedCharacters.end()) {
			std::cerr << "store_summary: survivors should exclude the lost character\n";
			return false;
		}
		if (summary.totalTurns != 2) {
			std::cerr << "store_summary: expected total turns to follow the current turn\n";
			return false;
		}

		const auto stats = CalculateChapterStats(summary);
		if (stats.survivalRate != 75.0 || stats.lossRate != 25.0) {
			std::cerr << "store_summary: expected 75% survival and 25% loss rate\n";
			return false;
		}

		const auto state = store.GetStateStatistics();
		if (!state.isInitialized || state.totalLosses != 1u || state.totalParticipants != 4u || state.averageLossPerTurn != 0.5) {
			std::cerr << "store_summary: unexpected state statistics\n";
			return false;
		}

		store.Cleanup();
		if (store.IsChapterInitialized() || store.GetTotalLosses() != 0u) {
			std::cerr << "store_summary: cleanup should reset the ledger\n";
			return false;
		}
		return true;
	}

	bool CheckStoreValidateAndRepair()
	{
		LossRecordStore source;
		source.InitializeChapter("ch1");
		(void)source.RecordLoss(MakeUnit("A", "Alice"), MakeCause());
		(void)source.RecordLoss(MakeUnit("B", "Bob"), MakeCause());
		(void)source.RecordLoss(MakeUnit("C", "Cleo"), MakeCause());
		auto data = source.Serialize();

		// A: fine. B: missing from history. C: missing from the lost map.
		data.lossHistory.erase(
			std::remove_if(data.lossHistory.begin(), data.lossHistory.end(), [](const LossRecord& a_record) { return a_record.characterId == "B"; }),
			data.lossHistory.end());
		data.lostCharacters.erase("C");

		LossRecordStore store;
		store.Deserialize(data);
		if (store.ValidateState() || store.GetStateErrors().size() != 2u) {
			std::cerr << "store_repair: inconsistent ledger should report two errors\n";
			return false;
		}

		const auto report = store.ValidateAndRepair();
		if (!report.isValid || report.repaired.empty()) {
			std::cerr << "store_repair: repair should succeed and report its fixes\n";
			return false;
		}
		if (!store.ValidateState()) {
			std::cerr << "store_repair: ledger should be consistent after repair\n";
			return false;
		}
		if (store.GetTotalLosses() != 3u || store.GetLossHistory().size() != 3u) {
			std::cerr << "store_repair: both views should hold all three losses\n";
			return false;
		}
		for (const auto* id : { "A", "B", "C" }) {
			if (!store.IsLost(id) || store.GetParticipatingCharacters().count(id) == 0) {
				std::cerr << "store_repair: every lost character should be lost and participating\n";
				return false;
			}
		}

		const auto second = store.ValidateAndRepair();
		if (!second.repaired.empty()) {
			std::cerr << "store_repair: repairing a consistent ledger should change nothing\n";
			return false;
		}
		return true;
	}

	bool CheckStoreCheckpointAndMerge()
	{
		LossRecordStore store;
		try {
			(void)store.CreateCheckpoint();
			std::cerr << "store_checkpoint: checkpoint before initialization should throw\n";
			return false;
		} catch (const LossError&) {
		}

		store.InitializeChapter("ch1");
		(void)store.RecordLoss(MakeUnit("A", "Alice"), MakeCause());
		const auto checkpoint = store.CreateCheckpoint();
		(void)store.RecordLoss(MakeUnit("B", "Bob"), MakeCause());

		store.RestoreFromCheckpoint(checkpoint);
		if (store.GetTotalLosses() != 1u || store.IsLost("B")) {
			std::cerr << "store_checkpoint: restore should drop losses after the checkpoint\n";
			return false;
		}

		ChapterLossData broken = checkpoint;
		broken.version.clear();
		try {
			store.RestoreFromCheckpoint(broken);
			std::cerr << "store_checkpoint: invalid checkpoint should throw\n";
			return false;
		} catch (const LossError& e) {
			if (e.Kind() != LossErrorKind::kSaveDataCorrupted) {
				std::cerr << "store_checkpoint: expected save_data_corrupted\n";
				return false;
			}
		}

		LossRecordStore other;
		other.InitializeChapter("ch1");
		(void)other.RecordLoss(MakeUnit("C", "Cleo"), MakeCause());
		auto otherData = other.Serialize();
		otherData.chapterStartTime = checkpoint.chapterStartTime - 1000;
		otherData.lossHistory.push_back(checkpoint.lossHistory.front());
		otherData.lostCharacters.emplace("A", checkpoint.lostCharacters.at("A"));

		store.MergeState(otherData);
		if (store.GetTotalLosses() != 2u || store.GetLossHistory().size() != 2u) {
			std::cerr << "store_merge: duplicate history records should be merged once\n";
			return false;
		}
		if (store.GetChapterStartTime() != otherData.chapterStartTime) {
			std::cerr << "store_merge: earliest start time should win\n";
			return false;
		}

		LossRecordStore fresh;
		fresh.MergeState(checkpoint);
		if (!fresh.IsChapterInitialized() || !fresh.IsLost("A")) {
			std::cerr << "store_merge: merging into an empty store should load the data\n";
			return false;
		}
		return true;
	}

	bool CheckStoreExportImport()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		store.SetCurrentTurn(4);
		auto unit = MakeUnit("A", "Alice");
		unit.position = Position{ 3, 5 };
		unit.wasRecruited = true;
		(void)store.RecordLoss(unit, MakeStatusEffectCause(StatusEffectType::kPoison, 12.0));

		const auto exported = store.ExportState();
		if (exported.find('\n') == std::string::npos) {
			std::cerr << "store_export: export should be pretty-printed\n";
			return false;
		}

		LossRecordStore imported;
		imported.ImportState(exported);
		if (!(imported.Serialize() == store.Serialize())) {
			std::cerr << "store_export: import should reproduce the exported ledger\n";
			return false;
		}
		if (imported.GetCurrentTurn() != 4) {
			std::cerr << "store_export: current turn should be rebuilt from history\n";
			return false;
		}

		try {
			imported.ImportState("not json");
			std::cerr << "store_export: malformed import should throw\n";
			return false;
		} catch (const LossError& e) {
			if (e.Kind() != LossErrorKind::kSaveDataCorrupted) {
				std::cerr << "store_export: expected save_data_corrupted\n";
				return false;
			}
		}
		if (!imported.IsLost("A")) {
			std::cerr << "store_export: failed import should leave the ledger untouched\n";
			return false;
		}
		return true;
	}
}
