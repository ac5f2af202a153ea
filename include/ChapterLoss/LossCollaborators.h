#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss
{
	struct UnitUpdateResult
	{
		bool success{ false };
		std::string message{};
	};

	enum class NotificationSeverity : std::uint8_t
	{
		kInfo = 0,
		kWarning,
		kError
	};

	struct UserNotification
	{
		NotificationSeverity severity{ NotificationSeverity::kInfo };
		std::string title{};
		std::string message{};
		std::string details{};
		bool dismissible{ true };
	};

	struct GameOverInfo
	{
		std::string reason{};
		std::uint32_t totalLosses{ 0 };
		std::string chapterId{};
		std::vector<LostCharacter> lostCharacters{};
		std::int64_t chapterDuration{ 0 };
	};

	inline constexpr std::string_view kGameOverReasonAllLost = "all_characters_lost";

	class IRecruitmentCollaborator
	{
	public:
		virtual ~IRecruitmentCollaborator() = default;

		virtual void HandleNpcLoss(const Unit& a_unit) = 0;
	};

	class IGameStateCollaborator
	{
	public:
		virtual ~IGameStateCollaborator() = default;

		virtual UnitUpdateResult UpdateUnit(const Unit& a_unit) = 0;
		[[nodiscard]] virtual std::int32_t GetCurrentTurn() const = 0;
	};

	class IPresentationCollaborator
	{
	public:
		virtual ~IPresentationCollaborator() = default;

		// Blocks until the animation is done (or skipped by the implementation).
		virtual void PlayLossAnimation(const Unit& a_unit, const LossCause& a_cause) = 0;
		virtual void ShowDangerEffect(const Unit& a_unit, DangerLevel a_level) = 0;
		virtual void HideDangerEffect(const Unit& a_unit) = 0;
	};

	class IUiCollaborator
	{
	public:
		virtual ~IUiCollaborator() = default;

		virtual void RefreshPartyStatus(const std::vector<LostCharacter>& a_lostCharacters) = 0;
		virtual void ShowGameOverScreen(const GameOverInfo& a_info) = 0;
		virtual void ShowNotification(const UserNotification& a_notice) = 0;
	};

	// Last chance to salvage bad input before the caller gives up. Returning nullopt means
	// "could not repair"; returned data is validated again by the caller.
	class ILossRecoveryHandler
	{
	public:
		virtual ~ILossRecoveryHandler() = default;

		[[nodiscard]] virtual std::optional<Unit> RepairUnit(const Unit& a_unit) = 0;
		[[nodiscard]] virtual std::optional<ChapterLossData> RepairSaveData(
			std::string_view a_chapterId,
			std::string_view a_payload) = 0;
	};

	// Every pointer is optional and non-owning. A null collaborator turns the matching step into a no-op.
	struct LossCollaborators
	{
		IRecruitmentCollaborator* recruitment{ nullptr };
		IGameStateCollaborator* gameState{ nullptr };
		IPresentationCollaborator* presentation{ nullptr };
		IUiCollaborator* ui{ nullptr };
		ILossRecoveryHandler* recovery{ nullptr };
	};
}
