#include "ChapterLoss/LossOrchestrator.h"
#include "ChapterLoss/LossValidation.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		using Clock = std::chrono::steady_clock;

		[[nodiscard]] double ElapsedMs(Clock::time_point a_since)
		{
			return std::chrono::duration<double, std::milli>(Clock::now() - a_since).count();
		}

		// Marks the orchestrator busy for the lifetime of one loss flow.
		class ProcessingScope
		{
		public:
			explicit ProcessingScope(bool& a_flag) :
				_flag(a_flag)
			{
				_flag = true;
			}

			~ProcessingScope() { _flag = false; }

			ProcessingScope(const ProcessingScope&) = delete;
			ProcessingScope& operator=(const ProcessingScope&) = delete;

		private:
			bool& _flag;
		};
	}

	std::optional<LostCharacter> LossOrchestrator::ProcessCharacterLoss(
		const Unit& a_unit,
		const LossCause& a_cause,
		LossProcessingOptions a_options)
	{
		if (_processing) {
			spdlog::debug("ChapterLoss: loss for {} queued behind the loss in flight.", a_unit.id);
			_pending.push_back(PendingLoss{ a_unit, a_cause, std::move(a_options) });
			return std::nullopt;
		}

		LostCharacter lost{};
		try {
			lost = RunLossFlow(a_unit, a_cause, a_options);
		} catch (const LossError&) {
			DrainPendingLosses();
			throw;
		}
		DrainPendingLosses();
		return lost;
	}

	void LossOrchestrator::DrainPendingLosses()
	{
		while (!_pending.empty() && !_processing) {
			PendingLoss next = std::move(_pending.front());
			_pending.pop_front();
			try {
				(void)RunLossFlow(next.unit, next.cause, next.options);
			} catch (const LossError& e) {
				// Already reported through the error callback and CharacterLossErrorEvent.
				spdlog::warn("ChapterLoss: queued loss for {} failed ({}).", next.unit.id, e.what());
			}
		}
	}

	LostCharacter LossOrchestrator::RunLossFlow(Unit a_unit, const LossCause& a_cause, const LossProcessingOptions& a_options)
	{
		ProcessingScope scope(_processing);
		const auto startedAt = Clock::now();
		double presentationMs = 0.0;

		try {
			if (!IsInitialized()) {
				Notify(
					NotificationSeverity::kError,
					"Chapter not initialized",
					"Initialize the chapter before processing character losses.",
					true);
				throw LossError(
					LossErrorKind::kChapterNotInitialized,
					"Chapter must be initialized before processing losses",
					MakeContext(a_unit.id, "loss_processing"));
			}

			if (IsBlank(a_unit.id)) {
				auto repaired = RepairUnit(a_unit);
				if (!repaired || IsBlank(repaired->id)) {
					throw LossError(
						LossErrorKind::kInvalidCharacter,
						"Invalid unit provided for loss processing",
						MakeContext(a_unit.id, "loss_processing"));
				}
				spdlog::info("ChapterLoss: character data repaired as {}, continuing with loss processing.", repaired->id);
				a_unit = std::move(*repaired);
			}

			if (!Validation::IsValidLossCause(a_cause)) {
				Notify(
					NotificationSeverity::kError,
					"Invalid loss cause",
					"The loss cause data is invalid. Check the system log.",
					true);
				throw LossError(
					LossErrorKind::kInvalidLossCause,
					"Invalid loss cause provided",
					MakeContext(a_unit.id, "loss_processing"));
			}

			if (auto existing = _store.GetLostCharacter(a_unit.id)) {
				spdlog::info("ChapterLoss: character {} is already lost, skipping duplicate processing.", a_unit.id);
				return *existing;
			}

			if (_config.orchestrator.enableLossLogging) {
				spdlog::info(
					"ChapterLoss: processing character loss for {} ({}): {}",
					a_unit.name,
					a_unit.id,
					a_cause.description);
			}

			if (_config.orchestrator.enableRecruitmentIntegration &&
				(a_unit.faction == Faction::kNpc || a_unit.wasRecruited)) {
				NotifyRecruitment(a_unit);
			}

			if (!a_options.skipPresentation && !_config.orchestrator.skipPresentation) {
				const auto presentationStart = Clock::now();
				PlayLossPresentation(a_unit, a_cause);
				presentationMs = ElapsedMs(presentationStart);
			}

			SyncTurnFromGameState();

			// Past this point the loss is permanent; later steps only log their failures.
			const LostCharacter lost = _store.RecordLoss(a_unit, a_cause);
			_lastLossProcessedAt = NowEpochMs();

			a_unit.currentHP = 0;
			PushDefeatedUnit(a_unit);
			if (const auto it = std::find_if(_units.begin(), _units.end(), [&](const Unit& u) { return u.id == a_unit.id; });
				it != _units.end()) {
				it->currentHP = 0;
			}

			CheckGameOverCondition();
			UpdateDangerLevels();

			const auto saved = SaveChapterState();
			if (!saved.success) {
				spdlog::warn("ChapterLoss: auto-save after loss of {} failed: {}", a_unit.id, saved.message);
			}
			RefreshPartyStatus();

			CharacterLossProcessedEvent event{};
			event.unit = a_unit;
			event.cause = a_cause;
			event.lostCharacter = lost;
			event.totalLosses = _store.GetTotalLosses();
			_events.Publish(event);

			if (a_options.onComplete) {
				try {
					a_options.onComplete(lost);
				} catch (const std::exception& e) {
					spdlog::error("ChapterLoss: loss completion callback threw ({}).", e.what());
				}
			}

			const double processingMs = ElapsedMs(startedAt) - presentationMs;
			if (processingMs > _config.orchestrator.performanceWarningMs) {
				spdlog::warn(
					"ChapterLoss: loss processing took {:.2f}ms (limit {:.2f}ms), may impact performance.",
					processingMs,
					_config.orchestrator.performanceWarningMs);

				PerformanceWarningEvent warning{};
				warning.type = "loss_processing_slow";
				warning.processingTimeMs = processingMs;
				warning.thresholdMs = _config.orchestrator.performanceWarningMs;
				warning.unitId = a_unit.id;
				warning.causeType = a_cause.type;
				_events.Publish(warning);
			}

			if (_config.orchestrator.enableLossLogging) {
				spdlog::info("ChapterLoss: character loss processed for {} in {:.2f}ms.", a_unit.name, processingMs);
			}
			return lost;
		} catch (const LossError& e) {
			ReportLossFailure(a_unit, a_cause, a_options, e.Details());
			throw;
		} catch (const std::exception& e) {
			LossError wrapped(
				LossErrorKind::kLossProcessingFailed,
				fmt::format("Unexpected error during loss processing: {}", e.what()),
				MakeContext(a_unit.id, "loss_processing"));
			ReportLossFailure(a_unit, a_cause, a_options, wrapped.Details());
			throw wrapped;
		}
	}

	void LossOrchestrator::ReportLossFailure(
		const Unit& a_unit,
		const LossCause& a_cause,
		const LossProcessingOptions& a_options,
		const LossErrorDetails& a_details)
	{
		spdlog::error(
			"ChapterLoss: loss processing failed for {} [{}]: {}",
			a_unit.id,
			ToString(a_details.kind),
			a_details.message);

		if (a_options.onError) {
			try {
				a_options.onError(a_details);
			} catch (const std::exception& e) {
				spdlog::error("ChapterLoss: loss error callback threw ({}).", e.what());
			}
		}

		CharacterLossErrorEvent event{};
		event.unit = a_unit;
		event.cause = a_cause;
		event.error = a_details;
		_events.Publish(event);
	}

	std::optional<LostCharacter> LossOrchestrator::OnUnitDefeated(const Unit& a_unit, const std::optional<BattleOutcome>& a_outcome)
	{
		if (!_config.orchestrator.enableAutoLossProcessing) {
			return std::nullopt;
		}
		if (a_unit.faction == Faction::kEnemy) {
			spdlog::debug("ChapterLoss: enemy unit {} defeated; not a character loss.", a_unit.id);
			return std::nullopt;
		}

		LossCause cause{};
		if (a_outcome) {
			cause = a_outcome->isCritical ?
			            MakeCriticalDamageCause(a_outcome->attackerId, a_outcome->attackerName, a_outcome->finalDamage) :
			            MakeBattleDefeatCause(a_outcome->attackerId, a_outcome->attackerName, a_outcome->finalDamage);
		} else {
			cause.type = LossCauseType::kBattleDefeat;
			cause.description = "Character defeated in battle";
			cause.timestamp = NowEpochMs();
		}

		try {
			return ProcessCharacterLoss(a_unit, cause);
		} catch (const LossError& e) {
			spdlog::warn("ChapterLoss: automatic loss processing for {} failed ({}).", a_unit.id, e.what());
			return std::nullopt;
		}
	}

	void LossOrchestrator::OnUnitUpdated(const Unit& a_unit)
	{
		if (IsBlank(a_unit.id)) {
			return;
		}
		const auto it = std::find_if(_units.begin(), _units.end(), [&](const Unit& u) { return u.id == a_unit.id; });
		if (it == _units.end()) {
			return;
		}
		*it = a_unit;
		ApplyDangerLevel(*it, CalculateDangerLevel(*it));
	}

	void LossOrchestrator::OnTurnChanged(std::int32_t a_turn)
	{
		_store.SetCurrentTurn(a_turn);
	}

	void LossOrchestrator::CheckGameOverCondition()
	{
		if (_gameOverNotified || !IsGameOver()) {
			return;
		}
		_gameOverNotified = true;
		spdlog::warn("ChapterLoss: all player characters lost in chapter {}; game over.", _store.GetCurrentChapterId());

		if (const auto info = GetGameOverInfo()) {
			ShowGameOverScreen(*info);

			AllCharactersLostEvent allLost{};
			allLost.chapterId = info->chapterId;
			allLost.totalLosses = info->totalLosses;
			allLost.lostCharacters = info->lostCharacters;
			allLost.reason = info->reason;
			_events.Publish(allLost);

			GameOverEvent gameOver{};
			gameOver.reason = info->reason;
			gameOver.chapterId = info->chapterId;
			gameOver.totalLosses = info->totalLosses;
			try {
				gameOver.finalState = _store.GetChapterSummary();
			} catch (const LossError& e) {
				spdlog::warn("ChapterLoss: game over summary unavailable ({}).", e.what());
			}
			_events.Publish(gameOver);
		}
	}

	void LossOrchestrator::SeedDangerLevels()
	{
		_dangerLevels.clear();
		for (const auto& unit : _units) {
			_dangerLevels.insert_or_assign(unit.id, CalculateDangerLevel(unit));
		}
	}

	void LossOrchestrator::UpdateDangerLevels()
	{
		// Copy: handlers of the change event may push unit updates back into the roster.
		const auto units = _units;
		for (const auto& unit : units) {
			if (unit.currentHP > 0) {
				ApplyDangerLevel(unit, CalculateDangerLevel(unit));
			}
		}
	}

	void LossOrchestrator::ApplyDangerLevel(const Unit& a_unit, DangerLevel a_newLevel)
	{
		const auto it = _dangerLevels.find(a_unit.id);
		const DangerLevel oldLevel = it != _dangerLevels.end() ? it->second : DangerLevel::kNone;
		if (oldLevel == a_newLevel) {
			return;
		}
		_dangerLevels.insert_or_assign(a_unit.id, a_newLevel);

		if (_config.orchestrator.enableDangerWarnings) {
			if (a_newLevel != DangerLevel::kNone) {
				ShowDangerEffect(a_unit, a_newLevel);
			} else {
				HideDangerEffect(a_unit);
			}
		}

		DangerLevelChangedEvent event{};
		event.unit = a_unit;
		event.oldLevel = oldLevel;
		event.newLevel = a_newLevel;
		_events.Publish(event);
	}

	LossContext LossOrchestrator::MakeContext(std::string_view a_characterId, std::string_view a_phase) const
	{
		LossContext context{};
		context.characterId = std::string(a_characterId);
		context.chapterId = _store.GetCurrentChapterId();
		context.turn = _store.GetCurrentTurn();
		context.phase = std::string(a_phase);
		return context;
	}
}
