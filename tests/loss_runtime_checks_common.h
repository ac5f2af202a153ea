#pragma once

#include "ChapterLoss/DefaultLossRecoveryHandler.h"
#include "ChapterLoss/KeyValueStore.h"
#include "ChapterLoss/LossCollaborators.h"
#include "ChapterLoss/LossConfig.h"
#include "ChapterLoss/LossContract.h"
#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossEvents.h"
#include "ChapterLoss/LossLogging.h"
#include "ChapterLoss/LossOrchestrator.h"
#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/LossSerialization.h"
#include "ChapterLoss/LossTypes.h"
#include "ChapterLoss/PartyCompositionValidator.h"
#include "ChapterLoss/PersistenceGateway.h"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace LossRuntimeChecks
{
	using namespace ChapterLoss;

	inline Unit MakeUnit(
		std::string_view a_id,
		std::string_view a_name,
		Faction a_faction = Faction::kPlayer,
		std::int32_t a_level = 10,
		std::int32_t a_currentHP = 100,
		std::int32_t a_maxHP = 100)
	{
		Unit unit{};
		unit.id = std::string(a_id);
		unit.name = std::string(a_name);
		unit.faction = a_faction;
		unit.level = a_level;
		unit.currentHP = a_currentHP;
		unit.maxHP = a_maxHP;
		return unit;
	}

	inline LossCause MakeCause()
	{
		return MakeBattleDefeatCause("enemy_1", "Bandit", 30.0);
	}

	class RecordingGameState final : public IGameStateCollaborator
	{
	public:
		UnitUpdateResult UpdateUnit(const Unit& a_unit) override
		{
			updates.push_back(a_unit);
			if (delay.count() > 0) {
				std::this_thread::sleep_for(delay);
			}
			return UnitUpdateResult{ true, {} };
		}

		[[nodiscard]] std::int32_t GetCurrentTurn() const override { return turn; }

		std::vector<Unit> updates{};
		std::int32_t turn{ 1 };
		std::chrono::milliseconds delay{ 0 };
	};

	class RecordingUi final : public IUiCollaborator
	{
	public:
		void RefreshPartyStatus(const std::vector<LostCharacter>& a_lostCharacters) override
		{
			++refreshCount;
			lastLostCount = a_lostCharacters.size();
		}

		void ShowGameOverScreen(const GameOverInfo& a_info) override
		{
			++gameOverCount;
			lastGameOver = a_info;
		}

		void ShowNotification(const UserNotification& a_notice) override { notifications.push_back(a_notice); }

		std::uint32_t refreshCount{ 0 };
		std::size_t lastLostCount{ 0 };
		std::uint32_t gameOverCount{ 0 };
		std::optional<GameOverInfo> lastGameOver{};
		std::vector<UserNotification> notifications{};
	};

	class RecordingPresentation final : public IPresentationCollaborator
	{
	public:
		void PlayLossAnimation(const Unit& a_unit, const LossCause&) override { animated.push_back(a_unit.id); }

		void ShowDangerEffect(const Unit& a_unit, DangerLevel a_level) override { shown.insert_or_assign(a_unit.id, a_level); }

		void HideDangerEffect(const Unit& a_unit) override { hidden.push_back(a_unit.id); }

		std::vector<std::string> animated{};
		std::map<std::string, DangerLevel> shown{};
		std::vector<std::string> hidden{};
	};

	class RecordingRecruitment final : public IRecruitmentCollaborator
	{
	public:
		void HandleNpcLoss(const Unit& a_unit) override { notified.push_back(a_unit.id); }

		std::vector<std::string> notified{};
	};

	// Refuses every repair so callers fall through to their own failure path.
	class RefusingRecovery final : public ILossRecoveryHandler
	{
	public:
		[[nodiscard]] std::optional<Unit> RepairUnit(const Unit&) override { return std::nullopt; }

		[[nodiscard]] std::optional<ChapterLossData> RepairSaveData(std::string_view, std::string_view) override
		{
			return std::nullopt;
		}
	};

	bool CheckStoreRecordLossIdempotence();
	bool CheckStoreRejectsInvalidInput();
	bool CheckStoreTurnMonotonicity();
	bool CheckStoreSummaryAndStatistics();
	bool CheckStoreValidateAndRepair();
	bool CheckStoreCheckpointAndMerge();
	bool CheckStoreExportImport();

	bool CheckSerializationRoundTrip();
	bool CheckSerializationRejectsMalformedPayloads();
	bool CheckSanitizeDropsInvalidEntries();
	bool CheckSuspendRecordRoundTrip();

	bool CheckGatewaySaveAndLoad();
	bool CheckGatewayRecoversFromBackup();
	bool CheckGatewayResetsWhenEverythingIsCorrupt();
	bool CheckGatewayRepairsDamagedEntries();
	bool CheckGatewayWritePolicy();
	bool CheckGatewayRejectsReservedChapterIds();
	bool CheckFileKeyValueStore();

	bool CheckOrchestratorLossFlow();
	bool CheckOrchestratorRejections();
	bool CheckOrchestratorGameOver();
	bool CheckOrchestratorTurnOrdering();
	bool CheckOrchestratorCompleteChapter();
	bool CheckOrchestratorQueuesReentrantLosses();
	bool CheckOrchestratorDangerLevels();
	bool CheckOrchestratorPerformanceWarning();
	bool CheckOrchestratorSuspendResume();
	bool CheckOrchestratorLoadRecovery();
	bool CheckOrchestratorUnitDefeated();
	bool CheckOrchestratorRepairsInconsistentLedger();

	bool CheckPartyValidationRules();
	bool CheckPartyLostMembers();
	bool CheckPartySuggestionsAndMessages();
	bool CheckPartyJsonInput();

	bool CheckConfigLoading();
	bool CheckEventBus();
	bool CheckLoggingLevels();
}
