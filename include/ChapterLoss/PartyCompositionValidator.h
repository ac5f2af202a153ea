#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ChapterLoss/LossConfig.h"
#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss
{
	enum class PartyIssueType : std::uint8_t
	{
		kLostCharacter = 0,
		kInsufficientMembers,
		kTooManyMembers,
		kInvalidCharacter,
		kDuplicateCharacter,
		kLowLevel,
		kUnbalancedParty,
		kMissingRole
	};

	enum class IssueSeverity : std::uint8_t
	{
		kError = 0,
		kHigh,
		kMedium,
		kLow
	};

	[[nodiscard]] constexpr std::string_view ToString(PartyIssueType a_type) noexcept
	{
		switch (a_type) {
		case PartyIssueType::kLostCharacter:
			return "lost_character";
		case PartyIssueType::kInsufficientMembers:
			return "insufficient_members";
		case PartyIssueType::kTooManyMembers:
			return "too_many_members";
		case PartyIssueType::kInvalidCharacter:
			return "invalid_character";
		case PartyIssueType::kDuplicateCharacter:
			return "duplicate_character";
		case PartyIssueType::kLowLevel:
			return "low_level";
		case PartyIssueType::kUnbalancedParty:
			return "unbalanced_party";
		case PartyIssueType::kMissingRole:
			return "missing_role";
		}
		return "invalid_character";
	}

	[[nodiscard]] constexpr std::string_view ToString(IssueSeverity a_severity) noexcept
	{
		switch (a_severity) {
		case IssueSeverity::kError:
			return "error";
		case IssueSeverity::kHigh:
			return "high";
		case IssueSeverity::kMedium:
			return "medium";
		case IssueSeverity::kLow:
			return "low";
		}
		return "error";
	}

	struct PartyIssue
	{
		PartyIssueType type{ PartyIssueType::kInvalidCharacter };
		std::string message{};
		std::optional<std::string> characterId{};
		IssueSeverity severity{ IssueSeverity::kError };
	};

	struct PartyValidationResult
	{
		bool isValid{ true };
		std::vector<PartyIssue> errors{};
		std::vector<PartyIssue> warnings{};
		std::vector<std::string> availableCharacters{};
		std::vector<LostCharacter> lostCharacters{};
		std::uint32_t totalAvailable{ 0 };
	};

	struct PartySuggestion
	{
		std::string characterId{};
		std::string characterName{};
		std::string reason{};
		std::int32_t priority{ 0 };
		std::optional<std::string> replacesLostCharacter{};
	};

	struct PartyErrorMessage
	{
		std::string message{};
		std::string suggestedFix{};
		bool isError{ true };
		bool actionable{ true };
		std::optional<std::string> characterId{};
	};

	struct SelectionCheck
	{
		bool canSelect{ false };
		std::string reason{};
	};

	inline constexpr std::int32_t kReplacementPriority = 10;

	// Read-only view over a loss ledger and a roster. "Available" means a player-faction roster
	// unit that is not lost and still has HP.
	class PartyCompositionValidator
	{
	public:
		explicit PartyCompositionValidator(const LossRecordStore& a_store, PartyRules a_rules = {});

		void SetRules(const PartyRules& a_rules) noexcept { _rules = a_rules; }
		[[nodiscard]] const PartyRules& Rules() const noexcept { return _rules; }

		[[nodiscard]] PartyValidationResult Validate(
			const std::vector<std::string>& a_party,
			const std::vector<Unit>& a_roster) const;

		// Entry point for untyped callers; anything but an array of strings is rejected.
		[[nodiscard]] PartyValidationResult ValidateJson(
			const nlohmann::json& a_party,
			const std::vector<Unit>& a_roster) const;

		[[nodiscard]] std::vector<std::string> GetAvailableCharacters(const std::vector<Unit>& a_roster) const;
		[[nodiscard]] std::vector<Unit> GetAvailableUnits(const std::vector<Unit>& a_roster) const;
		[[nodiscard]] SelectionCheck CanSelect(std::string_view a_characterId, const std::vector<Unit>& a_roster) const;

		// One distinct replacement per lost party member, best level first.
		[[nodiscard]] std::vector<PartySuggestion> SuggestReplacements(
			const std::vector<std::string>& a_party,
			const std::vector<Unit>& a_roster) const;

		// Replacements first, then strong characters outside the party, ordered by priority.
		[[nodiscard]] std::vector<PartySuggestion> GenerateSuggestions(
			const std::vector<std::string>& a_party,
			const std::vector<Unit>& a_roster,
			std::optional<std::uint32_t> a_maxSuggestions = std::nullopt) const;

		[[nodiscard]] std::vector<PartyErrorMessage> FormatErrorMessages(
			const PartyValidationResult& a_result,
			const std::vector<std::string>& a_party,
			const std::vector<Unit>& a_roster) const;

	private:
		[[nodiscard]] bool IsAvailable(const Unit& a_unit) const;

		const LossRecordStore& _store;
		PartyRules _rules{};
	};
}
