#include "ChapterLoss/PartyCompositionValidator.h"

#include <algorithm>
#include <set>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		constexpr std::uint32_t kCriticallyLowAvailable = 2;
		constexpr std::uint32_t kLowAvailable = 4;
		constexpr std::size_t kSmallPartySize = 3;

		[[nodiscard]] const Unit* FindUnit(const std::vector<Unit>& a_roster, std::string_view a_id)
		{
			const auto it = std::find_if(a_roster.begin(), a_roster.end(), [&](const Unit& a_unit) {
				return a_unit.id == a_id;
			});
			return it != a_roster.end() ? &*it : nullptr;
		}

		// Party members only resolve to player-faction roster entries.
		[[nodiscard]] const Unit* FindPartyCandidate(const std::vector<Unit>& a_roster, std::string_view a_id)
		{
			const auto* unit = FindUnit(a_roster, a_id);
			return unit && unit->faction == Faction::kPlayer ? unit : nullptr;
		}

		[[nodiscard]] bool Contains(const std::vector<std::string>& a_ids, std::string_view a_id)
		{
			return std::find(a_ids.begin(), a_ids.end(), a_id) != a_ids.end();
		}

		[[nodiscard]] double LevelVariance(const std::vector<std::int32_t>& a_levels)
		{
			if (a_levels.empty()) {
				return 0.0;
			}
			double sum = 0.0;
			for (const auto level : a_levels) {
				sum += level;
			}
			const double mean = sum / static_cast<double>(a_levels.size());
			double squares = 0.0;
			for (const auto level : a_levels) {
				const double delta = level - mean;
				squares += delta * delta;
			}
			return squares / static_cast<double>(a_levels.size());
		}

		void SortByLevelDescending(std::vector<Unit>& a_units)
		{
			std::stable_sort(a_units.begin(), a_units.end(), [](const Unit& a_lhs, const Unit& a_rhs) {
				return std::max(a_lhs.level, 1) > std::max(a_rhs.level, 1);
			});
		}
	}

	PartyCompositionValidator::PartyCompositionValidator(const LossRecordStore& a_store, PartyRules a_rules) :
		_store(a_store),
		_rules(std::move(a_rules))
	{}

	bool PartyCompositionValidator::IsAvailable(const Unit& a_unit) const
	{
		return a_unit.faction == Faction::kPlayer && a_unit.currentHP > 0 && !_store.IsLost(a_unit.id);
	}

	std::vector<std::string> PartyCompositionValidator::GetAvailableCharacters(const std::vector<Unit>& a_roster) const
	{
		std::vector<std::string> ids;
		for (const auto& unit : a_roster) {
			if (IsAvailable(unit)) {
				ids.push_back(unit.id);
			}
		}
		return ids;
	}

	std::vector<Unit> PartyCompositionValidator::GetAvailableUnits(const std::vector<Unit>& a_roster) const
	{
		std::vector<Unit> units;
		for (const auto& unit : a_roster) {
			if (IsAvailable(unit)) {
				units.push_back(unit);
			}
		}
		return units;
	}

	SelectionCheck PartyCompositionValidator::CanSelect(std::string_view a_characterId, const std::vector<Unit>& a_roster) const
	{
		SelectionCheck check{};
		const auto* unit = FindUnit(a_roster, a_characterId);
		if (!unit) {
			check.reason = "Character not found";
			return check;
		}
		if (const auto lost = _store.GetLostCharacter(a_characterId)) {
			check.reason = fmt::format("Character is lost and cannot be used in this chapter ({})", lost->cause.description);
			return check;
		}
		if (unit->currentHP <= 0) {
			check.reason = "Character has no HP remaining";
			return check;
		}
		if (unit->faction != Faction::kPlayer) {
			check.reason = "Only player characters can be selected";
			return check;
		}
		check.canSelect = true;
		return check;
	}

	PartyValidationResult PartyCompositionValidator::Validate(
		const std::vector<std::string>& a_party,
		const std::vector<Unit>& a_roster) const
	{
		PartyValidationResult result{};
		result.availableCharacters = GetAvailableCharacters(a_roster);
		result.lostCharacters = _store.GetLostCharacters();
		result.totalAvailable = static_cast<std::uint32_t>(result.availableCharacters.size());

		const auto addError = [&](PartyIssueType a_type, std::string a_message, std::optional<std::string> a_characterId = std::nullopt) {
			result.isValid = false;
			result.errors.push_back(PartyIssue{ a_type, std::move(a_message), std::move(a_characterId), IssueSeverity::kError });
		};
		const auto addWarning = [&](PartyIssueType a_type, std::string a_message, IssueSeverity a_severity, std::optional<std::string> a_characterId = std::nullopt) {
			result.warnings.push_back(PartyIssue{ a_type, std::move(a_message), std::move(a_characterId), a_severity });
		};

		const auto partySize = static_cast<std::uint32_t>(a_party.size());
		if (a_party.empty()) {
			if (!_rules.allowEmptyParty) {
				addError(PartyIssueType::kInsufficientMembers, "Party cannot be empty");
			}
		} else if (partySize < _rules.minPartySize) {
			addError(PartyIssueType::kInsufficientMembers, fmt::format("Party must have at least {} member(s)", _rules.minPartySize));
		}
		if (partySize > _rules.maxPartySize) {
			addError(PartyIssueType::kTooManyMembers, fmt::format("Party cannot have more than {} members", _rules.maxPartySize));
		}

		const std::set<std::string, std::less<>> unique(a_party.begin(), a_party.end());
		if (unique.size() != a_party.size()) {
			addError(PartyIssueType::kDuplicateCharacter, "Party cannot contain duplicate characters");
		}

		std::vector<std::int32_t> validLevels;
		std::unordered_set<std::string> seenValid;
		for (const auto& characterId : a_party) {
			const auto* unit = FindPartyCandidate(a_roster, characterId);
			if (!unit) {
				addError(PartyIssueType::kInvalidCharacter, fmt::format("Character not found: {}", characterId), characterId);
				continue;
			}

			const auto lost = _store.GetLostCharacter(characterId);
			if (lost) {
				addError(
					PartyIssueType::kLostCharacter,
					fmt::format("{} is lost and cannot be used in this chapter ({})", unit->name, lost->cause.description),
					characterId);
			} else if (seenValid.insert(characterId).second) {
				validLevels.push_back(std::max(unit->level, 1));
			}

			if (unit->level < _rules.lowLevelThreshold) {
				addWarning(
					PartyIssueType::kLowLevel,
					fmt::format("{} is low level (Level {})", unit->name, unit->level),
					IssueSeverity::kMedium,
					characterId);
			}
		}

		if (!a_party.empty() && result.totalAvailable < _rules.minPartySize) {
			addError(
				PartyIssueType::kInsufficientMembers,
				fmt::format(
					"Not enough available characters ({} available, {} required)",
					result.totalAvailable,
					_rules.minPartySize));
		}

		if (result.totalAvailable > 0 && result.totalAvailable <= kCriticallyLowAvailable) {
			addWarning(
				PartyIssueType::kMissingRole,
				"Very few characters available - consider being more careful in battle",
				IssueSeverity::kHigh);
		} else if (result.totalAvailable > kCriticallyLowAvailable && result.totalAvailable <= kLowAvailable) {
			addWarning(
				PartyIssueType::kMissingRole,
				"Limited characters available - plan your strategy carefully",
				IssueSeverity::kMedium);
		}

		if (!validLevels.empty()) {
			if (LevelVariance(validLevels) > _rules.levelVarianceThreshold) {
				addWarning(PartyIssueType::kUnbalancedParty, "Party has characters with very different levels", IssueSeverity::kMedium);
			}
			if (validLevels.size() < kSmallPartySize && result.totalAvailable >= kSmallPartySize) {
				addWarning(PartyIssueType::kMissingRole, "Consider adding more characters for better tactical options", IssueSeverity::kLow);
			}
		}

		return result;
	}

	PartyValidationResult PartyCompositionValidator::ValidateJson(
		const nlohmann::json& a_party,
		const std::vector<Unit>& a_roster) const
	{
		if (!a_party.is_array()) {
			PartyValidationResult result{};
			result.availableCharacters = GetAvailableCharacters(a_roster);
			result.lostCharacters = _store.GetLostCharacters();
			result.totalAvailable = static_cast<std::uint32_t>(result.availableCharacters.size());
			result.isValid = false;
			result.errors.push_back(PartyIssue{ PartyIssueType::kInvalidCharacter, "Party members must be an array", std::nullopt, IssueSeverity::kError });
			return result;
		}

		std::vector<std::string> ids;
		std::vector<PartyIssue> entryErrors;
		for (const auto& entry : a_party) {
			if (entry.is_string()) {
				ids.push_back(entry.get<std::string>());
				continue;
			}
			entryErrors.push_back(PartyIssue{
				PartyIssueType::kInvalidCharacter,
				fmt::format("Invalid party member entry: {}", entry.dump()),
				std::nullopt,
				IssueSeverity::kError });
		}

		auto result = Validate(ids, a_roster);
		if (!entryErrors.empty()) {
			result.isValid = false;
			result.errors.insert(result.errors.begin(), entryErrors.begin(), entryErrors.end());
		}
		return result;
	}

	std::vector<PartySuggestion> PartyCompositionValidator::SuggestReplacements(
		const std::vector<std::string>& a_party,
		const std::vector<Unit>& a_roster) const
	{
		std::vector<Unit> candidates;
		for (auto& unit : GetAvailableUnits(a_roster)) {
			if (!Contains(a_party, unit.id)) {
				candidates.push_back(std::move(unit));
			}
		}
		SortByLevelDescending(candidates);

		std::vector<PartySuggestion> suggestions;
		std::unordered_set<std::string> handled;
		auto next = candidates.begin();
		for (const auto& memberId : a_party) {
			if (!handled.insert(memberId).second) {
				continue;
			}
			const auto lost = _store.GetLostCharacter(memberId);
			if (!lost) {
				continue;
			}
			if (next == candidates.end()) {
				break;
			}

			PartySuggestion suggestion{};
			suggestion.characterId = next->id;
			suggestion.characterName = next->name;
			suggestion.reason = fmt::format("Replacement for lost character {}", lost->name);
			suggestion.priority = kReplacementPriority;
			suggestion.replacesLostCharacter = memberId;
			suggestions.push_back(std::move(suggestion));
			++next;
		}
		return suggestions;
	}

	std::vector<PartySuggestion> PartyCompositionValidator::GenerateSuggestions(
		const std::vector<std::string>& a_party,
		const std::vector<Unit>& a_roster,
		std::optional<std::uint32_t> a_maxSuggestions) const
	{
		const std::uint32_t limit = a_maxSuggestions.value_or(_rules.maxSuggestions);
		auto suggestions = SuggestReplacements(a_party, a_roster);

		std::vector<Unit> others;
		for (auto& unit : GetAvailableUnits(a_roster)) {
			if (!Contains(a_party, unit.id)) {
				others.push_back(std::move(unit));
			}
		}
		SortByLevelDescending(others);
		if (others.size() > limit) {
			others.resize(limit);
		}

		for (const auto& unit : others) {
			const bool alreadySuggested = std::any_of(suggestions.begin(), suggestions.end(), [&](const PartySuggestion& a_suggestion) {
				return a_suggestion.characterId == unit.id;
			});
			if (alreadySuggested) {
				continue;
			}
			const std::int32_t level = std::max(unit.level, 1);
			PartySuggestion suggestion{};
			suggestion.characterId = unit.id;
			suggestion.characterName = unit.name;
			suggestion.reason = fmt::format("High-level character (Level {})", level);
			suggestion.priority = level;
			suggestions.push_back(std::move(suggestion));
		}

		std::stable_sort(suggestions.begin(), suggestions.end(), [](const PartySuggestion& a_lhs, const PartySuggestion& a_rhs) {
			return a_lhs.priority > a_rhs.priority;
		});
		if (suggestions.size() > limit) {
			suggestions.resize(limit);
		}
		return suggestions;
	}

	std::vector<PartyErrorMessage> PartyCompositionValidator::FormatErrorMessages(
		const PartyValidationResult& a_result,
		const std::vector<std::string>& a_party,
		const std::vector<Unit>& a_roster) const
	{
		std::vector<PartyErrorMessage> messages;
		const auto replacements = SuggestReplacements(a_party, a_roster);

		std::size_t fieldable = 0;
		std::unordered_set<std::string> counted;
		for (const auto& id : a_party) {
			if (Contains(a_result.availableCharacters, id) && counted.insert(id).second) {
				++fieldable;
			}
		}

		for (const auto& error : a_result.errors) {
			PartyErrorMessage message{};
			message.message = error.message;
			message.characterId = error.characterId;

			switch (error.type) {
			case PartyIssueType::kLostCharacter:
				{
					const auto replacement = std::find_if(replacements.begin(), replacements.end(), [&](const PartySuggestion& a_suggestion) {
						return a_suggestion.replacesLostCharacter == error.characterId;
					});
					if (replacement != replacements.end()) {
						message.suggestedFix = fmt::format("Replace with {}", replacement->characterName);
					} else if (!a_result.availableCharacters.empty()) {
						message.suggestedFix = "Choose from available characters list";
					} else {
						message.suggestedFix = "No available characters to replace with";
						message.actionable = false;
					}
				}
				break;
			case PartyIssueType::kInsufficientMembers:
				if (a_result.totalAvailable >= 1) {
					const std::size_t needed = _rules.minPartySize > fieldable ? _rules.minPartySize - fieldable : 0;
					message.suggestedFix = needed > 0 ? fmt::format("Add {} more character(s)", needed) : "Select available characters";
				} else {
					message.suggestedFix = "No available characters - complete previous stages to recruit more";
					message.actionable = false;
				}
				break;
			case PartyIssueType::kInvalidCharacter:
				message.suggestedFix = "Remove invalid character and select a valid one";
				break;
			case PartyIssueType::kDuplicateCharacter:
				message.suggestedFix = "Remove duplicate characters from party";
				break;
			default:
				message.suggestedFix = "Review party composition";
				break;
			}
			messages.push_back(std::move(message));
		}

		for (const auto& warning : a_result.warnings) {
			PartyErrorMessage message{};
			message.message = warning.message;
			message.characterId = warning.characterId;
			message.isError = false;

			switch (warning.type) {
			case PartyIssueType::kLowLevel:
				message.suggestedFix = "Consider using higher level characters if available";
				break;
			case PartyIssueType::kUnbalancedParty:
				message.suggestedFix = "Try to include characters with different roles";
				break;
			case PartyIssueType::kMissingRole:
				message.suggestedFix = "Be extra careful in battle to avoid losing more characters";
				break;
			default:
				message.suggestedFix = "Consider the warning when planning strategy";
				break;
			}
			messages.push_back(std::move(message));
		}

		spdlog::debug("ChapterLoss: formatted {} party composition message(s).", messages.size());
		return messages;
	}
}
