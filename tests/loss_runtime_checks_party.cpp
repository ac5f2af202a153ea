#include "loss_runtime_checks_common.h"

#include <nlohmann/json.hpp>

namespace LossRuntimeChecks
{
	namespace
	{
		std::vector<Unit> MakeRoster()
		{
			return {
				MakeUnit("A", "Alice", Faction::kPlayer, 10),
				MakeUnit("B", "Bob", Faction::kPlayer, 12),
				MakeUnit("C", "Cid", Faction::kPlayer, 3),
				MakeUnit("D", "Dan", Faction::kPlayer, 11),
				MakeUnit("E", "Orc", Faction::kEnemy, 9),
				MakeUnit("F", "Fay", Faction::kPlayer, 8, 0, 100)
			};
		}

		bool HasIssue(const std::vector<PartyIssue>& a_issues, PartyIssueType a_type)
		{
			return std::any_of(a_issues.begin(), a_issues.end(), [&](const PartyIssue& a_issue) { return a_issue.type == a_type; });
		}
	}

	bool CheckPartyValidationRules()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		const PartyCompositionValidator validator(store);
		const auto roster = MakeRoster();

		const auto empty = validator.Validate(std::vector<std::string>{}, roster);
		if (empty.isValid || empty.errors.size() != 1u || empty.errors.front().message != "Party cannot be empty") {
			std::cerr << "party_rules: empty party should be refused\n";
			return false;
		}

		const auto good = validator.Validate(std::vector<std::string>{ "A", "B", "D" }, roster);
		if (!good.isValid || !good.errors.empty() || good.totalAvailable != 4u) {
			std::cerr << "party_rules: healthy party should validate\n";
			return false;
		}
		if (good.warnings.size() != 1u || good.warnings.front().severity != IssueSeverity::kMedium ||
			good.warnings.front().type != PartyIssueType::kMissingRole) {
			std::cerr << "party_rules: four available characters should raise a limited-roster warning\n";
			return false;
		}
		if (std::find(good.availableCharacters.begin(), good.availableCharacters.end(), "F") != good.availableCharacters.end() ||
			std::find(good.availableCharacters.begin(), good.availableCharacters.end(), "E") != good.availableCharacters.end()) {
			std::cerr << "party_rules: fallen and enemy units are not available\n";
			return false;
		}

		const auto oversized = validator.Validate(std::vector<std::string>{ "A", "B", "C", "D", "A", "B", "C" }, roster);
		if (oversized.isValid || !HasIssue(oversized.errors, PartyIssueType::kTooManyMembers) ||
			!HasIssue(oversized.errors, PartyIssueType::kDuplicateCharacter)) {
			std::cerr << "party_rules: oversized party with repeats should report both problems\n";
			return false;
		}

		const auto duplicate = validator.Validate({ "A", "A" }, roster);
		if (duplicate.isValid || !HasIssue(duplicate.errors, PartyIssueType::kDuplicateCharacter)) {
			std::cerr << "party_rules: duplicate members should be refused\n";
			return false;
		}

		const auto foreign = validator.Validate(std::vector<std::string>{ "A", "E", "Q" }, roster);
		if (foreign.isValid || foreign.errors.size() != 2u || foreign.errors[0].message != "Character not found: E" ||
			foreign.errors[0].characterId != std::optional<std::string>{ "E" } || foreign.errors[1].message != "Character not found: Q") {
			std::cerr << "party_rules: enemies and unknown ids should not resolve\n";
			return false;
		}

		const auto rookie = validator.Validate(std::vector<std::string>{ "C" }, roster);
		const auto lowLevel = std::find_if(rookie.warnings.begin(), rookie.warnings.end(), [](const PartyIssue& a_issue) {
			return a_issue.type == PartyIssueType::kLowLevel;
		});
		if (!rookie.isValid || lowLevel == rookie.warnings.end() || lowLevel->characterId != std::optional<std::string>{ "C" } ||
			lowLevel->message != "Cid is low level (Level 3)") {
			std::cerr << "party_rules: low level member should be flagged\n";
			return false;
		}

		auto spread = roster;
		spread.push_back(MakeUnit("G", "Gorm", Faction::kPlayer, 30));
		const auto unbalanced = validator.Validate(std::vector<std::string>{ "C", "G" }, spread);
		if (!unbalanced.isValid || !HasIssue(unbalanced.warnings, PartyIssueType::kUnbalancedParty)) {
			std::cerr << "party_rules: wide level spread should be flagged\n";
			return false;
		}

		PartyRules strict{};
		strict.minPartySize = 3;
		const PartyCompositionValidator strictValidator(store, strict);
		const std::vector<std::string> solo{ "B" };
		const auto tooSmall = strictValidator.Validate(solo, roster);
		if (tooSmall.isValid || tooSmall.errors.front().message != "Party must have at least 3 member(s)") {
			std::cerr << "party_rules: party below the minimum should be refused\n";
			return false;
		}
		const auto messages = strictValidator.FormatErrorMessages(tooSmall, solo, roster);
		if (messages.empty() || messages.front().suggestedFix != "Add 2 more character(s)" || !messages.front().isError) {
			std::cerr << "party_rules: fix should say how many members are missing\n";
			return false;
		}
		return true;
	}

	bool CheckPartyLostMembers()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		const auto roster = MakeRoster();
		(void)store.RecordLoss(roster.front(), MakeCause());

		const PartyCompositionValidator validator(store);
		const auto result = validator.Validate(std::vector<std::string>{ "A", "B" }, roster);
		if (result.isValid || result.errors.size() != 1u) {
			std::cerr << "party_lost: party with a lost member should be refused\n";
			return false;
		}
		const auto& error = result.errors.front();
		if (error.type != PartyIssueType::kLostCharacter || error.characterId != std::optional<std::string>{ "A" } ||
			error.message.rfind("Alice is lost and cannot be used in this chapter", 0) != 0) {
			std::cerr << "party_lost: error should name the lost member\n";
			return false;
		}
		if (result.lostCharacters.size() != 1u || result.totalAvailable != 3u ||
			std::find(result.availableCharacters.begin(), result.availableCharacters.end(), "A") != result.availableCharacters.end()) {
			std::cerr << "party_lost: lost member should leave the available list\n";
			return false;
		}

		if (validator.CanSelect("A", roster).canSelect ||
			validator.CanSelect("A", roster).reason.rfind("Character is lost", 0) != 0) {
			std::cerr << "party_lost: lost member cannot be selected\n";
			return false;
		}
		if (!validator.CanSelect("B", roster).canSelect ||
			validator.CanSelect("F", roster).reason != "Character has no HP remaining" ||
			validator.CanSelect("E", roster).reason != "Only player characters can be selected" ||
			validator.CanSelect("Q", roster).reason != "Character not found") {
			std::cerr << "party_lost: selection reasons mismatch\n";
			return false;
		}

		// Same rules through the orchestrator, which supplies its tracked roster.
		MemoryKeyValueStore storage;
		LossOrchestrator orchestrator(storage);
		(void)orchestrator.InitializeChapter("ch1", roster);
		(void)orchestrator.ProcessCharacterLoss(roster.front(), MakeCause());
		const auto viaOrchestrator = orchestrator.ValidatePartyComposition({ "A", "B" });
		if (viaOrchestrator.isValid || !HasIssue(viaOrchestrator.errors, PartyIssueType::kLostCharacter) ||
			orchestrator.CanSelectCharacterForParty("A").canSelect) {
			std::cerr << "party_lost: orchestrator should apply the same party rules\n";
			return false;
		}
		if (orchestrator.GetAvailableCharacters() != std::vector<std::string>{ "B", "C", "D" }) {
			std::cerr << "party_lost: orchestrator available list mismatch\n";
			return false;
		}
		return true;
	}

	bool CheckPartySuggestionsAndMessages()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		const auto roster = MakeRoster();
		(void)store.RecordLoss(roster.front(), MakeCause());

		const PartyCompositionValidator validator(store);
		const std::vector<std::string> party{ "A", "B" };

		const auto replacements = validator.SuggestReplacements(party, roster);
		if (replacements.size() != 1u || replacements.front().characterId != "D" ||
			replacements.front().priority != kReplacementPriority ||
			replacements.front().replacesLostCharacter != std::optional<std::string>{ "A" }) {
			std::cerr << "party_suggest: best available character should replace the lost one\n";
			return false;
		}

		const auto suggestions = validator.GenerateSuggestions(party, roster);
		if (suggestions.size() != 2u || suggestions[0].characterId != "D" || suggestions[1].characterId != "C" ||
			suggestions[1].priority != 3 || suggestions[1].replacesLostCharacter.has_value()) {
			std::cerr << "party_suggest: replacement first, then remaining characters by level\n";
			return false;
		}
		const auto capped = validator.GenerateSuggestions(party, roster, 1u);
		if (capped.size() != 1u || capped.front().characterId != "D") {
			std::cerr << "party_suggest: suggestion count should be capped\n";
			return false;
		}

		const auto result = validator.Validate(party, roster);
		const auto messages = validator.FormatErrorMessages(result, party, roster);
		if (messages.empty() || messages.front().suggestedFix != "Replace with Dan" || !messages.front().isError ||
			!messages.front().actionable) {
			std::cerr << "party_suggest: lost member message should propose the replacement\n";
			return false;
		}
		const bool warningsFollow = std::all_of(messages.begin() + 1, messages.end(), [](const PartyErrorMessage& a_message) {
			return !a_message.isError;
		});
		if (!warningsFollow) {
			std::cerr << "party_suggest: warnings should follow the errors\n";
			return false;
		}
		return true;
	}

	bool CheckPartyJsonInput()
	{
		LossRecordStore store;
		store.InitializeChapter("ch1");
		const PartyCompositionValidator validator(store);
		const auto roster = MakeRoster();

		const auto notArray = validator.ValidateJson(nlohmann::json{ { "members", "A" } }, roster);
		if (notArray.isValid || notArray.errors.size() != 1u || notArray.errors.front().message != "Party members must be an array" ||
			notArray.totalAvailable != 4u) {
			std::cerr << "party_json: non-array input should be refused\n";
			return false;
		}

		const auto mixed = validator.ValidateJson(nlohmann::json::array({ "B", 5 }), roster);
		if (mixed.isValid || mixed.errors.empty() || mixed.errors.front().message != "Invalid party member entry: 5") {
			std::cerr << "party_json: non-string entries should be reported\n";
			return false;
		}

		const auto strings = validator.ValidateJson(nlohmann::json::array({ "A", "B", "D" }), roster);
		if (!strings.isValid || !strings.errors.empty()) {
			std::cerr << "party_json: array of valid ids should validate\n";
			return false;
		}

		MemoryKeyValueStore storage;
		LossOrchestrator orchestrator(storage);
		(void)orchestrator.InitializeChapter("ch1", roster);
		const auto typed = orchestrator.ValidatePartyComposition({ "A", "B" });
		const auto untyped = orchestrator.ValidatePartyCompositionJson(nlohmann::json::array({ "A", "B" }));
		if (!typed.isValid || !untyped.isValid || typed.availableCharacters != untyped.availableCharacters ||
			orchestrator.ValidatePartyCompositionJson(nlohmann::json("A")).isValid) {
			std::cerr << "party_json: typed and untyped orchestrator entry points should agree\n";
			return false;
		}
		return true;
	}
}
