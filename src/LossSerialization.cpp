#include "ChapterLoss/LossSerialization.h"
#include "ChapterLoss/LossContract.h"
#include "ChapterLoss/LossValidation.h"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ChapterLoss::LossSerialization
{
	using namespace ChapterLoss::LossContract;

	namespace
	{
		[[nodiscard]] const nlohmann::json* FindField(const nlohmann::json& a_object, std::string_view a_key)
		{
			if (!a_object.is_object()) {
				return nullptr;
			}
			const auto it = a_object.find(std::string(a_key));
			if (it == a_object.end()) {
				return nullptr;
			}
			return &*it;
		}

		// Absent and null are both "not provided".
		[[nodiscard]] const nlohmann::json* FindOptionalField(const nlohmann::json& a_object, std::string_view a_key)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || field->is_null()) {
				return nullptr;
			}
			return field;
		}

		[[nodiscard]] bool ReadString(const nlohmann::json& a_object, std::string_view a_key, std::string& a_out)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || !field->is_string()) {
				return false;
			}
			a_out = field->get<std::string>();
			return true;
		}

		[[nodiscard]] bool ReadInt64(const nlohmann::json& a_object, std::string_view a_key, std::int64_t& a_out)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || !field->is_number()) {
				return false;
			}
			if (field->is_number_float()) {
				const double value = field->get<double>();
				if (!std::isfinite(value) ||
					value > static_cast<double>(std::numeric_limits<std::int64_t>::max()) ||
					value < static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
					return false;
				}
				a_out = static_cast<std::int64_t>(value);
				return true;
			}
			a_out = field->get<std::int64_t>();
			return true;
		}

		[[nodiscard]] bool ReadInt32(const nlohmann::json& a_object, std::string_view a_key, std::int32_t& a_out)
		{
			std::int64_t wide = 0;
			if (!ReadInt64(a_object, a_key, wide)) {
				return false;
			}
			if (wide > std::numeric_limits<std::int32_t>::max() || wide < std::numeric_limits<std::int32_t>::min()) {
				return false;
			}
			a_out = static_cast<std::int32_t>(wide);
			return true;
		}

		[[nodiscard]] bool ReadBool(const nlohmann::json& a_object, std::string_view a_key, bool& a_out)
		{
			const auto* field = FindField(a_object, a_key);
			if (!field || !field->is_boolean()) {
				return false;
			}
			a_out = field->get<bool>();
			return true;
		}

		[[nodiscard]] nlohmann::json EncodePosition(const Position& a_position)
		{
			nlohmann::json j = nlohmann::json::object();
			j[std::string(kFieldX)] = a_position.x;
			j[std::string(kFieldY)] = a_position.y;
			return j;
		}

		[[nodiscard]] bool DecodePosition(const nlohmann::json& a_json, Position& a_out)
		{
			return ReadInt32(a_json, kFieldX, a_out.x) && ReadInt32(a_json, kFieldY, a_out.y);
		}

		void EncodeLostCharacterFields(const LostCharacter& a_lost, nlohmann::json& a_out)
		{
			a_out[std::string(kFieldCharacterId)] = a_lost.characterId;
			a_out[std::string(kFieldName)] = a_lost.name;
			a_out[std::string(kFieldLostAt)] = a_lost.lostAt;
			a_out[std::string(kFieldTurn)] = a_lost.turn;
			a_out[std::string(kFieldCause)] = EncodeLossCause(a_lost.cause);
			a_out[std::string(kFieldLevel)] = a_lost.level;
			a_out[std::string(kFieldWasRecruited)] = a_lost.wasRecruited;
			if (a_lost.position) {
				a_out[std::string(kFieldPosition)] = EncodePosition(*a_lost.position);
			}
		}
	}

	nlohmann::json EncodeLossCause(const LossCause& a_cause)
	{
		nlohmann::json j = nlohmann::json::object();
		j[std::string(kFieldCauseType)] = std::string(ToString(a_cause.type));
		j[std::string(kFieldCauseDescription)] = a_cause.description;
		if (a_cause.sourceId) {
			j[std::string(kFieldCauseSourceId)] = *a_cause.sourceId;
		}
		if (a_cause.sourceName) {
			j[std::string(kFieldCauseSourceName)] = *a_cause.sourceName;
		}
		if (a_cause.damageAmount) {
			j[std::string(kFieldCauseDamageAmount)] = *a_cause.damageAmount;
		}
		if (a_cause.statusType) {
			j[std::string(kFieldCauseStatusType)] = std::string(ToString(*a_cause.statusType));
		}
		j[std::string(kFieldCauseTimestamp)] = a_cause.timestamp;
		return j;
	}

	nlohmann::json EncodeLostCharacter(const LostCharacter& a_lost)
	{
		nlohmann::json j = nlohmann::json::object();
		EncodeLostCharacterFields(a_lost, j);
		return j;
	}

	nlohmann::json EncodeLossRecord(const LossRecord& a_record)
	{
		nlohmann::json j = nlohmann::json::object();
		EncodeLostCharacterFields(a_record, j);
		j[std::string(kFieldChapterId)] = a_record.chapterId;
		j[std::string(kFieldStageId)] = a_record.stageId;
		j[std::string(kFieldRecoverable)] = a_record.recoverable;
		return j;
	}

	nlohmann::json EncodeChapterLossData(const ChapterLossData& a_data)
	{
		nlohmann::json lost = nlohmann::json::object();
		for (const auto& [id, character] : a_data.lostCharacters) {
			lost[id] = EncodeLostCharacter(character);
		}

		nlohmann::json history = nlohmann::json::array();
		for (const auto& record : a_data.lossHistory) {
			history.push_back(EncodeLossRecord(record));
		}

		nlohmann::json j = nlohmann::json::object();
		j[std::string(kFieldChapterId)] = a_data.chapterId;
		j[std::string(kFieldLostCharacters)] = std::move(lost);
		j[std::string(kFieldLossHistory)] = std::move(history);
		j[std::string(kFieldChapterStartTime)] = a_data.chapterStartTime;
		j[std::string(kFieldVersion)] = a_data.version;
		return j;
	}

	nlohmann::json EncodeSuspendRecord(const SuspendRecord& a_record)
	{
		nlohmann::json danger = nlohmann::json::object();
		for (const auto& [id, level] : a_record.dangerLevels) {
			danger[id] = std::string(ToString(level));
		}

		nlohmann::json gameState = nlohmann::json::object();
		gameState[std::string(kFieldCurrentTurn)] = a_record.currentTurn;
		gameState[std::string(kFieldTotalLosses)] = a_record.totalLosses;
		gameState[std::string(kFieldDangerLevels)] = std::move(danger);

		nlohmann::json units = nlohmann::json::array();
		for (const auto& unit : a_record.units) {
			nlohmann::json u = nlohmann::json::object();
			u[std::string(kFieldUnitId)] = unit.id;
			u[std::string(kFieldCurrentHP)] = unit.currentHP;
			if (unit.position) {
				u[std::string(kFieldPosition)] = EncodePosition(*unit.position);
			}
			u[std::string(kFieldHasActed)] = unit.hasActed;
			u[std::string(kFieldHasMoved)] = unit.hasMoved;
			units.push_back(std::move(u));
		}

		nlohmann::json j = nlohmann::json::object();
		j[std::string(kFieldChapterId)] = a_record.chapterId;
		j[std::string(kFieldSuspendedAt)] = a_record.suspendedAt;
		j[std::string(kFieldGameState)] = std::move(gameState);
		j[std::string(kFieldUnits)] = std::move(units);
		return j;
	}

	bool DecodeLossCause(const nlohmann::json& a_json, LossCause& a_out)
	{
		if (!a_json.is_object()) {
			return false;
		}

		LossCause cause{};
		std::string typeText;
		if (!ReadString(a_json, kFieldCauseType, typeText)) {
			return false;
		}
		const auto type = ParseLossCauseType(typeText);
		if (!type) {
			return false;
		}
		cause.type = *type;

		if (!ReadString(a_json, kFieldCauseDescription, cause.description) ||
			!ReadInt64(a_json, kFieldCauseTimestamp, cause.timestamp)) {
			return false;
		}

		if (const auto* field = FindOptionalField(a_json, kFieldCauseSourceId)) {
			if (!field->is_string()) {
				return false;
			}
			cause.sourceId = field->get<std::string>();
		}
		if (const auto* field = FindOptionalField(a_json, kFieldCauseSourceName)) {
			if (!field->is_string()) {
				return false;
			}
			cause.sourceName = field->get<std::string>();
		}
		if (const auto* field = FindOptionalField(a_json, kFieldCauseDamageAmount)) {
			if (!field->is_number()) {
				return false;
			}
			cause.damageAmount = field->get<double>();
		}
		if (const auto* field = FindOptionalField(a_json, kFieldCauseStatusType)) {
			if (!field->is_string()) {
				return false;
			}
			const auto status = ParseStatusEffectType(field->get<std::string>());
			if (!status) {
				return false;
			}
			cause.statusType = *status;
		}

		a_out = std::move(cause);
		return true;
	}

	bool DecodeLostCharacter(const nlohmann::json& a_json, LostCharacter& a_out)
	{
		if (!a_json.is_object()) {
			return false;
		}

		LostCharacter lost{};
		if (!ReadString(a_json, kFieldCharacterId, lost.characterId) ||
			!ReadString(a_json, kFieldName, lost.name) ||
			!ReadInt64(a_json, kFieldLostAt, lost.lostAt) ||
			!ReadInt32(a_json, kFieldTurn, lost.turn) ||
			!ReadInt32(a_json, kFieldLevel, lost.level) ||
			!ReadBool(a_json, kFieldWasRecruited, lost.wasRecruited)) {
			return false;
		}

		const auto* cause = FindField(a_json, kFieldCause);
		if (!cause || !DecodeLossCause(*cause, lost.cause)) {
			return false;
		}

		if (const auto* field = FindOptionalField(a_json, kFieldPosition)) {
			Position position{};
			if (!DecodePosition(*field, position)) {
				return false;
			}
			lost.position = position;
		}

		a_out = std::move(lost);
		return true;
	}

	bool DecodeLossRecord(const nlohmann::json& a_json, LossRecord& a_out)
	{
		LossRecord record{};
		if (!DecodeLostCharacter(a_json, record)) {
			return false;
		}
		if (!ReadString(a_json, kFieldChapterId, record.chapterId) ||
			!ReadString(a_json, kFieldStageId, record.stageId)) {
			return false;
		}
		// Older blobs omitted the flag; losses are never recoverable.
		if (const auto* field = FindOptionalField(a_json, kFieldRecoverable)) {
			if (!field->is_boolean()) {
				return false;
			}
			record.recoverable = field->get<bool>();
		}

		a_out = std::move(record);
		return true;
	}

	bool DecodeChapterLossData(const nlohmann::json& a_json, ChapterLossData& a_out)
	{
		if (!a_json.is_object()) {
			return false;
		}

		ChapterLossData data{};
		if (!ReadString(a_json, kFieldChapterId, data.chapterId) ||
			!ReadInt64(a_json, kFieldChapterStartTime, data.chapterStartTime) ||
			!ReadString(a_json, kFieldVersion, data.version)) {
			return false;
		}

		const auto* lost = FindField(a_json, kFieldLostCharacters);
		if (!lost || !lost->is_object()) {
			return false;
		}
		for (const auto& [id, entry] : lost->items()) {
			LostCharacter character{};
			if (!DecodeLostCharacter(entry, character)) {
				return false;
			}
			data.lostCharacters.emplace(id, std::move(character));
		}

		const auto* history = FindField(a_json, kFieldLossHistory);
		if (!history || !history->is_array()) {
			return false;
		}
		data.lossHistory.reserve(history->size());
		for (const auto& entry : *history) {
			LossRecord record{};
			if (!DecodeLossRecord(entry, record)) {
				return false;
			}
			data.lossHistory.push_back(std::move(record));
		}

		a_out = std::move(data);
		return true;
	}

	bool DecodeSuspendRecord(const nlohmann::json& a_json, SuspendRecord& a_out)
	{
		if (!a_json.is_object()) {
			return false;
		}

		SuspendRecord record{};
		if (!ReadString(a_json, kFieldChapterId, record.chapterId) ||
			!ReadInt64(a_json, kFieldSuspendedAt, record.suspendedAt)) {
			return false;
		}

		const auto* gameState = FindField(a_json, kFieldGameState);
		if (!gameState || !gameState->is_object()) {
			return false;
		}
		std::int64_t totalLosses = 0;
		if (!ReadInt32(*gameState, kFieldCurrentTurn, record.currentTurn) ||
			!ReadInt64(*gameState, kFieldTotalLosses, totalLosses) ||
			totalLosses < 0) {
			return false;
		}
		record.totalLosses = static_cast<std::uint32_t>(totalLosses);

		if (const auto* danger = FindOptionalField(*gameState, kFieldDangerLevels)) {
			if (!danger->is_object()) {
				return false;
			}
			for (const auto& [id, value] : danger->items()) {
				if (!value.is_string()) {
					return false;
				}
				const auto level = ParseDangerLevel(value.get<std::string>());
				if (!level) {
					return false;
				}
				record.dangerLevels.emplace(id, *level);
			}
		}

		const auto* units = FindField(a_json, kFieldUnits);
		if (!units || !units->is_array()) {
			return false;
		}
		for (const auto& entry : *units) {
			SuspendedUnitState unit{};
			if (!ReadString(entry, kFieldUnitId, unit.id) ||
				!ReadInt32(entry, kFieldCurrentHP, unit.currentHP) ||
				!ReadBool(entry, kFieldHasActed, unit.hasActed) ||
				!ReadBool(entry, kFieldHasMoved, unit.hasMoved)) {
				return false;
			}
			if (const auto* field = FindField(entry, kFieldPosition)) {
				Position position{};
				if (!DecodePosition(*field, position)) {
					return false;
				}
				unit.position = position;
			}
			record.units.push_back(std::move(unit));
		}

		a_out = std::move(record);
		return true;
	}

	std::string SerializeChapterLossData(const ChapterLossData& a_data, int a_indent)
	{
		return EncodeChapterLossData(a_data).dump(a_indent);
	}

	bool ParseChapterLossData(std::string_view a_payload, ChapterLossData& a_out)
	{
		nlohmann::json j;
		try {
			j = nlohmann::json::parse(a_payload.begin(), a_payload.end());
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: failed to parse chapter loss payload ({}).", e.what());
			return false;
		}

		ChapterLossData data{};
		if (!DecodeChapterLossData(j, data)) {
			spdlog::warn("ChapterLoss: chapter loss payload has an invalid structure.");
			return false;
		}
		if (!Validation::IsValidChapterLossData(data)) {
			spdlog::warn("ChapterLoss: chapter loss payload for {} failed validation.", data.chapterId);
			return false;
		}

		a_out = std::move(data);
		return true;
	}

	ChapterLossData SanitizeChapterLossData(const nlohmann::json& a_json, std::string_view a_fallbackChapterId)
	{
		std::string chapterId;
		if (!a_json.is_object() || !ReadString(a_json, kFieldChapterId, chapterId) || IsBlank(chapterId)) {
			return CreateDefaultChapterLossData(a_fallbackChapterId);
		}

		ChapterLossData sanitized = CreateDefaultChapterLossData(chapterId);
		std::int64_t startTime = 0;
		if (ReadInt64(a_json, kFieldChapterStartTime, startTime) && startTime > 0) {
			sanitized.chapterStartTime = startTime;
		}
		std::string version;
		if (ReadString(a_json, kFieldVersion, version) && !version.empty()) {
			sanitized.version = std::move(version);
		}

		if (const auto* lost = FindField(a_json, kFieldLostCharacters); lost && lost->is_object()) {
			for (const auto& [id, entry] : lost->items()) {
				LostCharacter character{};
				if (!IsBlank(id) && DecodeLostCharacter(entry, character) && character.characterId == id &&
					Validation::IsValidLostCharacter(character)) {
					sanitized.lostCharacters.emplace(id, std::move(character));
				}
			}
		}

		if (const auto* history = FindField(a_json, kFieldLossHistory); history && history->is_array()) {
			for (const auto& entry : *history) {
				LossRecord record{};
				if (DecodeLossRecord(entry, record) && Validation::IsValidLossRecord(record)) {
					sanitized.lossHistory.push_back(std::move(record));
				}
			}
		}

		return sanitized;
	}
}
