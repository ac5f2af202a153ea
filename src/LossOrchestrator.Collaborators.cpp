#include "ChapterLoss/LossOrchestrator.h"

#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	// Collaborator failures never abort the loss flow; they are logged and the step is skipped.

	void LossOrchestrator::NotifyRecruitment(const Unit& a_unit)
	{
		if (!_collaborators.recruitment) {
			return;
		}
		try {
			_collaborators.recruitment->HandleNpcLoss(a_unit);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: recruitment notice for {} failed ({}).", a_unit.id, e.what());
		}
	}

	void LossOrchestrator::PlayLossPresentation(const Unit& a_unit, const LossCause& a_cause)
	{
		if (!_collaborators.presentation) {
			return;
		}
		try {
			_collaborators.presentation->PlayLossAnimation(a_unit, a_cause);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: loss animation for {} failed ({}).", a_unit.id, e.what());
		}
	}

	void LossOrchestrator::PushDefeatedUnit(const Unit& a_unit)
	{
		if (!_collaborators.gameState) {
			return;
		}
		try {
			const auto result = _collaborators.gameState->UpdateUnit(a_unit);
			if (!result.success) {
				spdlog::warn("ChapterLoss: game state rejected update for {}: {}", a_unit.id, result.message);
			}
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: game state update for {} failed ({}).", a_unit.id, e.what());
		}
	}

	void LossOrchestrator::SyncTurnFromGameState()
	{
		if (!_collaborators.gameState) {
			return;
		}
		try {
			// Turns only move forward within a chapter; a stale host turn is ignored.
			const auto turn = _collaborators.gameState->GetCurrentTurn();
			if (turn > _store.GetCurrentTurn()) {
				_store.SetCurrentTurn(turn);
			}
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: failed to read current turn ({}).", e.what());
		}
	}

	void LossOrchestrator::ShowDangerEffect(const Unit& a_unit, DangerLevel a_level)
	{
		if (!_collaborators.presentation) {
			return;
		}
		try {
			_collaborators.presentation->ShowDangerEffect(a_unit, a_level);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: danger effect for {} failed ({}).", a_unit.id, e.what());
		}
	}

	void LossOrchestrator::HideDangerEffect(const Unit& a_unit)
	{
		if (!_collaborators.presentation) {
			return;
		}
		try {
			_collaborators.presentation->HideDangerEffect(a_unit);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: hiding danger effect for {} failed ({}).", a_unit.id, e.what());
		}
	}

	void LossOrchestrator::RefreshPartyStatus()
	{
		if (!_collaborators.ui) {
			return;
		}
		try {
			_collaborators.ui->RefreshPartyStatus(_store.GetLostCharacters());
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: party status refresh failed ({}).", e.what());
		}
	}

	void LossOrchestrator::ShowGameOverScreen(const GameOverInfo& a_info)
	{
		if (!_collaborators.ui) {
			return;
		}
		try {
			_collaborators.ui->ShowGameOverScreen(a_info);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: game over screen failed ({}).", e.what());
		}
	}

	void LossOrchestrator::Notify(NotificationSeverity a_severity, std::string a_title, std::string a_message, bool a_dismissible)
	{
		if (!_collaborators.ui) {
			return;
		}
		UserNotification notice{};
		notice.severity = a_severity;
		notice.title = std::move(a_title);
		notice.message = std::move(a_message);
		notice.dismissible = a_dismissible;
		try {
			_collaborators.ui->ShowNotification(notice);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: notification '{}' failed ({}).", notice.title, e.what());
		}
	}

	std::optional<Unit> LossOrchestrator::RepairUnit(const Unit& a_unit)
	{
		ILossRecoveryHandler* handler = _collaborators.recovery ? _collaborators.recovery : &_defaultRecovery;
		try {
			return handler->RepairUnit(a_unit);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: unit repair failed ({}).", e.what());
			return std::nullopt;
		}
	}
}
