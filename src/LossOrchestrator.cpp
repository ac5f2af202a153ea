#include "ChapterLoss/LossOrchestrator.h"

#include <algorithm>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	LossOrchestrator::LossOrchestrator(IKeyValueStore& a_storage, LossCollaborators a_collaborators, LossConfig a_config) :
		_config(std::move(a_config)),
		_thresholds(MakeDangerThresholds(_config.orchestrator)),
		_collaborators(a_collaborators),
		_gateway(a_storage, a_collaborators.recovery ? a_collaborators.recovery : &_defaultRecovery),
		_party(_store, _config.party)
	{}

	void LossOrchestrator::SetCollaborators(const LossCollaborators& a_collaborators)
	{
		_collaborators = a_collaborators;
		_gateway.SetRecoveryHandler(_collaborators.recovery ? _collaborators.recovery : &_defaultRecovery);
	}

	LossOrchestrator::OperationResult LossOrchestrator::InitializeChapter(std::string_view a_chapterId, std::vector<Unit> a_units)
	{
		OperationResult result{};
		if (IsBlank(a_chapterId)) {
			result.message = "Chapter ID cannot be empty";
			return result;
		}

		try {
			_store.InitializeChapter(a_chapterId);
		} catch (const LossError& e) {
			_phase = ChapterPhase::kUninitialized;
			result.message = fmt::format("Failed to initialize chapter: {}", e.what());
			spdlog::error("ChapterLoss: {}", result.message);
			return result;
		}

		_units = std::move(a_units);
		_dangerLevels.clear();
		_gameOverNotified = false;
		_lastLossProcessedAt = 0;

		ChapterInitializedEvent event{};
		event.chapterId = std::string(a_chapterId);
		event.unitCount = static_cast<std::uint32_t>(_units.size());
		for (const auto& unit : _units) {
			if (unit.faction != Faction::kEnemy) {
				_store.AddParticipatingCharacter(unit.id);
			}
			if (unit.faction == Faction::kPlayer) {
				++event.playerUnits;
			} else if (unit.faction == Faction::kEnemy) {
				++event.enemyUnits;
			}
		}
		SeedDangerLevels();
		_phase = ChapterPhase::kInitialized;

		_events.Publish(event);
		spdlog::info("ChapterLoss: chapter {} initialized with {} units.", a_chapterId, _units.size());

		result.success = true;
		result.message = fmt::format("Character loss system initialized for chapter {}", a_chapterId);
		return result;
	}

	LossOrchestrator::CompletionResult LossOrchestrator::CompleteChapter()
	{
		CompletionResult result{};
		if (!IsInitialized()) {
			result.message = "Chapter must be initialized to complete";
			return result;
		}

		const std::string chapterId = _store.GetCurrentChapterId();
		ChapterLossSummary summary{};
		try {
			summary = _store.GetChapterSummary();
		} catch (const LossError& e) {
			result.message = fmt::format("Failed to complete chapter: {}", e.what());
			spdlog::error("ChapterLoss: {}", result.message);
			return result;
		}

		const auto saved = SaveChapterState();
		if (!saved.success) {
			spdlog::warn("ChapterLoss: failed to save final chapter state: {}", saved.message);
		}

		ClearTrackedState();
		_store.Cleanup();
		_phase = ChapterPhase::kCompleted;

		// The chapter is closed; nothing it persisted may be resumed or reloaded.
		if (!_gateway.Remove(chapterId)) {
			spdlog::warn("ChapterLoss: failed to clear saved data for completed chapter {}.", chapterId);
		}
		if (!_gateway.RemoveSuspendRecord(chapterId)) {
			spdlog::warn("ChapterLoss: failed to clear suspend record for completed chapter {}.", chapterId);
		}

		ChapterCompletedEvent event{};
		event.chapterId = chapterId;
		event.summary = summary;
		event.completedAt = summary.completedAt;
		_events.Publish(event);

		spdlog::info(
			"ChapterLoss: chapter {} completed with {} losses{}.",
			chapterId,
			summary.lostCharacters.size(),
			summary.isPerfectClear ? " (perfect clear)" : "");

		result.success = true;
		result.message = fmt::format("Chapter {} completed successfully", chapterId);
		result.summary = std::move(summary);
		return result;
	}

	void LossOrchestrator::ResetChapterState()
	{
		const std::string chapterId = _store.GetCurrentChapterId();
		for (const auto& [unitId, level] : _dangerLevels) {
			if (level == DangerLevel::kNone) {
				continue;
			}
			const auto it = std::find_if(_units.begin(), _units.end(), [&](const Unit& a_unit) { return a_unit.id == unitId; });
			if (it != _units.end()) {
				HideDangerEffect(*it);
			}
		}

		_store.ResetChapterState();
		ClearTrackedState();
		_pending.clear();
		_phase = ChapterPhase::kUninitialized;
		spdlog::info("ChapterLoss: chapter state reset{}{}.", chapterId.empty() ? "" : " for ", chapterId);
	}

	void LossOrchestrator::ClearTrackedState()
	{
		_units.clear();
		_dangerLevels.clear();
		_gameOverNotified = false;
		_lastLossProcessedAt = 0;
	}

	ChapterPhase LossOrchestrator::GetPhase() const noexcept
	{
		if (_processing && _phase == ChapterPhase::kInitialized) {
			return ChapterPhase::kProcessingLoss;
		}
		return _phase;
	}

	bool LossOrchestrator::IsGameOver() const
	{
		if (!IsInitialized()) {
			return false;
		}
		return std::none_of(_units.begin(), _units.end(), [&](const Unit& a_unit) {
			return a_unit.faction == Faction::kPlayer && !_store.IsLost(a_unit.id);
		});
	}

	std::optional<GameOverInfo> LossOrchestrator::GetGameOverInfo() const
	{
		if (!IsGameOver()) {
			return std::nullopt;
		}

		GameOverInfo info{};
		info.reason = std::string(kGameOverReasonAllLost);
		info.totalLosses = _store.GetTotalLosses();
		info.chapterId = _store.GetCurrentChapterId();
		info.lostCharacters = _store.GetLostCharacters();
		info.chapterDuration = _store.GetChapterDuration();
		return info;
	}

	DangerLevel LossOrchestrator::CalculateDangerLevel(const Unit& a_unit) const noexcept
	{
		return ChapterLoss::CalculateDangerLevel(a_unit.currentHP, a_unit.maxHP, _thresholds);
	}

	std::optional<DangerLevel> LossOrchestrator::GetDangerLevel(std::string_view a_unitId) const
	{
		const auto it = _dangerLevels.find(a_unitId);
		if (it == _dangerLevels.end()) {
			return std::nullopt;
		}
		return it->second;
	}

	bool LossOrchestrator::IsCharacterLost(std::string_view a_characterId) const
	{
		return IsInitialized() && _store.IsLost(a_characterId);
	}

	std::map<std::string, bool> LossOrchestrator::CheckMultipleCharacterLossStates(const std::vector<std::string>& a_characterIds) const
	{
		std::map<std::string, bool> states;
		for (const auto& id : a_characterIds) {
			states.insert_or_assign(id, IsCharacterLost(id));
		}
		return states;
	}

	std::vector<LostCharacter> LossOrchestrator::GetLostCharacters() const
	{
		return _store.GetLostCharacters();
	}
}
