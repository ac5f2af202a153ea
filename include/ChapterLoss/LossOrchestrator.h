#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ChapterLoss/DefaultLossRecoveryHandler.h"
#include "ChapterLoss/KeyValueStore.h"
#include "ChapterLoss/LossCollaborators.h"
#include "ChapterLoss/LossConfig.h"
#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossEvents.h"
#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/LossTypes.h"
#include "ChapterLoss/PartyCompositionValidator.h"
#include "ChapterLoss/PersistenceGateway.h"

namespace ChapterLoss
{
	enum class ChapterPhase : std::uint8_t
	{
		kUninitialized = 0,
		kInitialized,
		kProcessingLoss,
		kCompleted
	};

	[[nodiscard]] constexpr std::string_view ToString(ChapterPhase a_phase) noexcept
	{
		switch (a_phase) {
		case ChapterPhase::kUninitialized:
			return "uninitialized";
		case ChapterPhase::kInitialized:
			return "initialized";
		case ChapterPhase::kProcessingLoss:
			return "processing_loss";
		case ChapterPhase::kCompleted:
			return "completed";
		}
		return "uninitialized";
	}

	struct LossProcessingOptions
	{
		bool skipPresentation{ false };
		std::function<void(const LostCharacter&)> onComplete{};
		std::function<void(const LossErrorDetails&)> onError{};
	};

	// Attack that finished a unit, as reported by the combat side.
	struct BattleOutcome
	{
		std::string attackerId{};
		std::string attackerName{};
		double finalDamage{ 0.0 };
		bool isCritical{ false };
	};

	// Drives the chapter lifecycle and the end-to-end loss flow. Single-threaded: a loss reported
	// while another is in flight (from a collaborator or an event handler) is queued and handled
	// in arrival order once the current one finishes.
	class LossOrchestrator
	{
	public:
		struct OperationResult
		{
			bool success{ false };
			std::string message{};
		};

		struct CompletionResult
		{
			bool success{ false };
			std::string message{};
			std::optional<ChapterLossSummary> summary{};
		};

		explicit LossOrchestrator(IKeyValueStore& a_storage, LossCollaborators a_collaborators = {}, LossConfig a_config = {});

		LossOrchestrator(const LossOrchestrator&) = delete;
		LossOrchestrator& operator=(const LossOrchestrator&) = delete;

		void SetCollaborators(const LossCollaborators& a_collaborators);
		[[nodiscard]] const LossCollaborators& GetCollaborators() const noexcept { return _collaborators; }

		// Chapter lifecycle.
		OperationResult InitializeChapter(std::string_view a_chapterId, std::vector<Unit> a_units);
		CompletionResult CompleteChapter();
		OperationResult SuspendChapter();
		OperationResult ResumeChapter(std::string_view a_chapterId, std::vector<Unit> a_units);
		void ResetChapterState();

		// Returns the recorded (or previously recorded) character. Returns nullopt only when the
		// call was queued behind a loss already in flight; queued results arrive through the
		// options callbacks and CharacterLossProcessedEvent. Throws LossError on rejection.
		std::optional<LostCharacter> ProcessCharacterLoss(
			const Unit& a_unit,
			const LossCause& a_cause,
			LossProcessingOptions a_options = {});

		// Combat hooks.
		std::optional<LostCharacter> OnUnitDefeated(const Unit& a_unit, const std::optional<BattleOutcome>& a_outcome = std::nullopt);
		void OnUnitUpdated(const Unit& a_unit);
		void OnTurnChanged(std::int32_t a_turn);

		// Persistence.
		OperationResult SaveChapterState();
		OperationResult LoadChapterState(std::string_view a_chapterId = {});
		OperationResult ClearChapterData(std::string_view a_chapterId);
		[[nodiscard]] bool HasSaveData(std::string_view a_chapterId) const;
		[[nodiscard]] std::optional<SaveDataInfo> GetSaveDataInfo(std::string_view a_chapterId) const;
		[[nodiscard]] bool HasSuspendedData(std::string_view a_chapterId) const;
		OperationResult ClearSuspendedData(std::string_view a_chapterId);

		// Game over.
		[[nodiscard]] bool IsGameOver() const;
		[[nodiscard]] std::optional<GameOverInfo> GetGameOverInfo() const;

		// Danger levels.
		[[nodiscard]] DangerLevel CalculateDangerLevel(const Unit& a_unit) const noexcept;
		[[nodiscard]] std::optional<DangerLevel> GetDangerLevel(std::string_view a_unitId) const;

		// Loss queries.
		[[nodiscard]] bool IsCharacterLost(std::string_view a_characterId) const;
		[[nodiscard]] std::map<std::string, bool> CheckMultipleCharacterLossStates(const std::vector<std::string>& a_characterIds) const;
		[[nodiscard]] std::vector<LostCharacter> GetLostCharacters() const;

		// Party composition.
		[[nodiscard]] std::vector<std::string> GetAvailableCharacters() const;
		[[nodiscard]] std::vector<Unit> GetAvailableCharacterUnits() const;
		[[nodiscard]] SelectionCheck CanSelectCharacterForParty(std::string_view a_characterId) const;
		[[nodiscard]] PartyValidationResult ValidatePartyComposition(const std::vector<std::string>& a_party) const;
		[[nodiscard]] PartyValidationResult ValidatePartyCompositionJson(const nlohmann::json& a_party) const;
		[[nodiscard]] std::vector<PartySuggestion> GeneratePartyCompositionSuggestions(
			const std::vector<std::string>& a_party = {},
			std::optional<std::uint32_t> a_maxSuggestions = std::nullopt) const;
		[[nodiscard]] std::vector<PartyErrorMessage> GeneratePartyCompositionErrorMessages(
			const PartyValidationResult& a_result,
			const std::vector<std::string>& a_party) const;

		// State.
		[[nodiscard]] ChapterPhase GetPhase() const noexcept;
		[[nodiscard]] bool IsInitialized() const noexcept { return _phase == ChapterPhase::kInitialized && _store.IsChapterInitialized(); }
		[[nodiscard]] bool IsProcessingLoss() const noexcept { return _processing; }
		[[nodiscard]] std::size_t GetPendingLossCount() const noexcept { return _pending.size(); }
		[[nodiscard]] const std::string& GetCurrentChapterId() const noexcept { return _store.GetCurrentChapterId(); }
		[[nodiscard]] std::uint32_t GetTotalLossesProcessed() const noexcept { return _store.GetTotalLosses(); }
		[[nodiscard]] std::int64_t GetLastLossProcessedAt() const noexcept { return _lastLossProcessedAt; }
		[[nodiscard]] const std::vector<Unit>& GetTrackedUnits() const noexcept { return _units; }
		[[nodiscard]] const LossConfig& GetConfig() const noexcept { return _config; }
		[[nodiscard]] const LossRecordStore& GetStore() const noexcept { return _store; }
		[[nodiscard]] LossEventBus& Events() noexcept { return _events; }

	private:
		struct PendingLoss
		{
			Unit unit{};
			LossCause cause{};
			LossProcessingOptions options{};
		};

		// LossOrchestrator.Processing.cpp
		LostCharacter RunLossFlow(Unit a_unit, const LossCause& a_cause, const LossProcessingOptions& a_options);
		void DrainPendingLosses();
		void ReportLossFailure(const Unit& a_unit, const LossCause& a_cause, const LossProcessingOptions& a_options, const LossErrorDetails& a_details);
		void CheckGameOverCondition();
		void UpdateDangerLevels();
		void ApplyDangerLevel(const Unit& a_unit, DangerLevel a_newLevel);
		void SeedDangerLevels();
		[[nodiscard]] LossContext MakeContext(std::string_view a_characterId, std::string_view a_phase) const;

		// LossOrchestrator.Collaborators.cpp
		void NotifyRecruitment(const Unit& a_unit);
		void PlayLossPresentation(const Unit& a_unit, const LossCause& a_cause);
		void PushDefeatedUnit(const Unit& a_unit);
		void SyncTurnFromGameState();
		void ShowDangerEffect(const Unit& a_unit, DangerLevel a_level);
		void HideDangerEffect(const Unit& a_unit);
		void RefreshPartyStatus();
		void ShowGameOverScreen(const GameOverInfo& a_info);
		void Notify(NotificationSeverity a_severity, std::string a_title, std::string a_message, bool a_dismissible);
		[[nodiscard]] std::optional<Unit> RepairUnit(const Unit& a_unit);

		void ClearTrackedState();

		LossConfig _config;
		DangerThresholds _thresholds{};
		LossCollaborators _collaborators{};
		DefaultLossRecoveryHandler _defaultRecovery{};
		LossRecordStore _store{};
		PersistenceGateway _gateway;
		PartyCompositionValidator _party;
		LossEventBus _events{};

		ChapterPhase _phase{ ChapterPhase::kUninitialized };
		std::vector<Unit> _units{};
		std::map<std::string, DangerLevel, std::less<>> _dangerLevels{};
		std::int64_t _lastLossProcessedAt{ 0 };
		bool _gameOverNotified{ false };
		bool _processing{ false };
		std::deque<PendingLoss> _pending{};
	};
}
