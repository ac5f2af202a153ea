#include "ChapterLoss/LossOrchestrator.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	LossOrchestrator::OperationResult LossOrchestrator::SaveChapterState()
	{
		OperationResult result{};
		if (!IsInitialized()) {
			result.message = "Chapter must be initialized before saving state";
			return result;
		}

		const auto saved = _gateway.Save(_store.GetCurrentChapterId(), _store.Serialize());
		result.success = saved.success;
		result.message = saved.message;
		if (saved.success && !saved.backupWritten) {
			spdlog::warn("ChapterLoss: backup copy for chapter {} was not written.", _store.GetCurrentChapterId());
		}
		return result;
	}

	LossOrchestrator::OperationResult LossOrchestrator::LoadChapterState(std::string_view a_chapterId)
	{
		OperationResult result{};
		const std::string target = IsBlank(a_chapterId) ? _store.GetCurrentChapterId() : std::string(a_chapterId);
		if (IsBlank(target)) {
			result.message = "Chapter ID must be provided or chapter must be initialized";
			return result;
		}

		auto loaded = _gateway.Load(target);
		if (!loaded.success) {
			Notify(
				NotificationSeverity::kError,
				"Save data unavailable",
				fmt::format("Chapter {} could not be loaded: {}", target, loaded.message),
				false);
			result.message = loaded.message;
			return result;
		}

		if (loaded.wasEmpty || !loaded.data) {
			if (IsInitialized() && _store.GetCurrentChapterId() == target) {
				result.success = true;
				result.message = fmt::format("No saved data for chapter {}; keeping current state", target);
				return result;
			}
			auto units = _units;
			auto initialized = InitializeChapter(target, std::move(units));
			result.success = initialized.success;
			result.message = initialized.success ?
			                     fmt::format("No saved data for chapter {}; started fresh", target) :
			                     initialized.message;
			return result;
		}

		try {
			_store.Deserialize(*loaded.data);
		} catch (const LossError& e) {
			result.message = fmt::format("Failed to restore chapter state: {}", e.what());
			spdlog::error("ChapterLoss: {}", result.message);
			return result;
		}

		if (!_store.ValidateState()) {
			const auto report = _store.ValidateAndRepair();
			for (const auto& note : report.repaired) {
				spdlog::info("ChapterLoss: {}", note);
			}
		}

		if (loaded.source != LoadSource::kPrimary) {
			spdlog::warn("ChapterLoss: chapter {} loaded via {}: {}", target, ToString(loaded.source), loaded.message);

			ChapterDataRecoveredEvent event{};
			event.chapterId = target;
			event.source = loaded.source;
			event.message = loaded.message;
			_events.Publish(event);
		}

		_phase = ChapterPhase::kInitialized;
		for (const auto& unit : _units) {
			if (unit.faction != Faction::kEnemy) {
				_store.AddParticipatingCharacter(unit.id);
			}
		}
		SyncTurnFromGameState();

		result.success = true;
		result.message = loaded.source == LoadSource::kPrimary ?
		                     fmt::format("Chapter state loaded for {}", target) :
		                     loaded.message;
		return result;
	}

	LossOrchestrator::OperationResult LossOrchestrator::ClearChapterData(std::string_view a_chapterId)
	{
		OperationResult result{};
		if (IsBlank(a_chapterId)) {
			result.message = "Chapter ID cannot be empty";
			return result;
		}

		if (!_gateway.Remove(a_chapterId)) {
			result.message = fmt::format("Failed to clear saved data for chapter {}", a_chapterId);
			return result;
		}
		if (_store.GetCurrentChapterId() == a_chapterId) {
			ResetChapterState();
		}

		result.success = true;
		result.message = fmt::format("Chapter data cleared for {}", a_chapterId);
		return result;
	}

	bool LossOrchestrator::HasSaveData(std::string_view a_chapterId) const
	{
		return _gateway.HasSaveData(a_chapterId);
	}

	std::optional<SaveDataInfo> LossOrchestrator::GetSaveDataInfo(std::string_view a_chapterId) const
	{
		return _gateway.GetSaveDataInfo(a_chapterId);
	}

	bool LossOrchestrator::HasSuspendedData(std::string_view a_chapterId) const
	{
		return _gateway.HasSuspendRecord(a_chapterId);
	}

	LossOrchestrator::OperationResult LossOrchestrator::ClearSuspendedData(std::string_view a_chapterId)
	{
		OperationResult result{};
		if (!_gateway.RemoveSuspendRecord(a_chapterId)) {
			result.message = fmt::format("Failed to clear suspended data for chapter {}", a_chapterId);
			return result;
		}
		result.success = true;
		result.message = fmt::format("Suspended data cleared for chapter {}", a_chapterId);
		return result;
	}

	LossOrchestrator::OperationResult LossOrchestrator::SuspendChapter()
	{
		OperationResult result{};
		if (!IsInitialized()) {
			result.message = "No active chapter to suspend";
			return result;
		}

		const auto saved = SaveChapterState();
		if (!saved.success) {
			result.message = fmt::format("Failed to save chapter state: {}", saved.message);
			return result;
		}

		SuspendRecord record{};
		record.chapterId = _store.GetCurrentChapterId();
		record.suspendedAt = NowEpochMs();
		record.currentTurn = _store.GetCurrentTurn();
		record.totalLosses = _store.GetTotalLosses();
		for (const auto& [unitId, level] : _dangerLevels) {
			record.dangerLevels.emplace(unitId, level);
		}
		record.units.reserve(_units.size());
		for (const auto& unit : _units) {
			SuspendedUnitState state{};
			state.id = unit.id;
			state.currentHP = unit.currentHP;
			state.position = unit.position;
			state.hasActed = unit.hasActed;
			state.hasMoved = unit.hasMoved;
			record.units.push_back(std::move(state));
		}

		if (!_gateway.SaveSuspendRecord(record)) {
			result.message = fmt::format("Failed to write suspend record for chapter {}", record.chapterId);
			return result;
		}

		ChapterSuspendedEvent event{};
		event.chapterId = record.chapterId;
		event.suspendedAt = record.suspendedAt;
		event.totalLosses = record.totalLosses;
		_events.Publish(event);

		spdlog::info("ChapterLoss: chapter {} suspended at turn {}.", record.chapterId, record.currentTurn);
		result.success = true;
		result.message = fmt::format("Chapter {} suspended", record.chapterId);
		return result;
	}

	LossOrchestrator::OperationResult LossOrchestrator::ResumeChapter(std::string_view a_chapterId, std::vector<Unit> a_units)
	{
		OperationResult result{};
		if (IsBlank(a_chapterId)) {
			result.message = "Chapter ID cannot be empty";
			return result;
		}

		const auto record = _gateway.LoadSuspendRecord(a_chapterId);
		_units = std::move(a_units);

		const auto loaded = LoadChapterState(a_chapterId);
		if (!loaded.success) {
			result.message = fmt::format("Failed to resume chapter: {}", loaded.message);
			return result;
		}

		if (record) {
			for (const auto& state : record->units) {
				const auto it = std::find_if(_units.begin(), _units.end(), [&](const Unit& u) { return u.id == state.id; });
				if (it == _units.end()) {
					continue;
				}
				it->currentHP = state.currentHP;
				it->position = state.position;
				it->hasActed = state.hasActed;
				it->hasMoved = state.hasMoved;
			}
			_dangerLevels.clear();
			for (const auto& [unitId, level] : record->dangerLevels) {
				_dangerLevels.insert_or_assign(unitId, level);
			}
			_store.SetCurrentTurn(record->currentTurn);
			if (!_gateway.RemoveSuspendRecord(a_chapterId)) {
				spdlog::warn("ChapterLoss: failed to remove suspend record for chapter {}.", a_chapterId);
			}
		} else {
			SeedDangerLevels();
		}
		_gameOverNotified = false;

		ChapterResumedEvent event{};
		event.chapterId = std::string(a_chapterId);
		event.resumedAt = NowEpochMs();
		event.totalLosses = _store.GetTotalLosses();
		event.lostCharacters = _store.GetLostCharacters();
		_events.Publish(event);

		spdlog::info(
			"ChapterLoss: chapter {} resumed with {} losses{}.",
			a_chapterId,
			event.totalLosses,
			record ? "" : " (no suspend record)");
		result.success = true;
		result.message = fmt::format("Chapter {} resumed", a_chapterId);
		return result;
	}
}
