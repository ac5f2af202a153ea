#include "ChapterLoss/LossOrchestrator.h"

#include <nlohmann/json.hpp>

namespace ChapterLoss
{
	std::vector<std::string> LossOrchestrator::GetAvailableCharacters() const
	{
		return _party.GetAvailableCharacters(_units);
	}

	std::vector<Unit> LossOrchestrator::GetAvailableCharacterUnits() const
	{
		return _party.GetAvailableUnits(_units);
	}

	SelectionCheck LossOrchestrator::CanSelectCharacterForParty(std::string_view a_characterId) const
	{
		return _party.CanSelect(a_characterId, _units);
	}

	PartyValidationResult LossOrchestrator::ValidatePartyComposition(const std::vector<std::string>& a_party) const
	{
		return _party.Validate(a_party, _units);
	}

	PartyValidationResult LossOrchestrator::ValidatePartyCompositionJson(const nlohmann::json& a_party) const
	{
		return _party.ValidateJson(a_party, _units);
	}

	std::vector<PartySuggestion> LossOrchestrator::GeneratePartyCompositionSuggestions(
		const std::vector<std::string>& a_party,
		std::optional<std::uint32_t> a_maxSuggestions) const
	{
		return _party.GenerateSuggestions(a_party, _units, a_maxSuggestions.value_or(_config.party.maxSuggestions));
	}

	std::vector<PartyErrorMessage> LossOrchestrator::GeneratePartyCompositionErrorMessages(
		const PartyValidationResult& a_result,
		const std::vector<std::string>& a_party) const
	{
		return _party.FormatErrorMessages(a_result, a_party, _units);
	}
}
