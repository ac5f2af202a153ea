#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss::LossSerialization
{
	[[nodiscard]] nlohmann::json EncodeLossCause(const LossCause& a_cause);
	[[nodiscard]] nlohmann::json EncodeLostCharacter(const LostCharacter& a_lost);
	[[nodiscard]] nlohmann::json EncodeLossRecord(const LossRecord& a_record);
	[[nodiscard]] nlohmann::json EncodeChapterLossData(const ChapterLossData& a_data);
	[[nodiscard]] nlohmann::json EncodeSuspendRecord(const SuspendRecord& a_record);

	// Strict decoders: any missing field or type mismatch fails the whole value.
	[[nodiscard]] bool DecodeLossCause(const nlohmann::json& a_json, LossCause& a_out);
	[[nodiscard]] bool DecodeLostCharacter(const nlohmann::json& a_json, LostCharacter& a_out);
	[[nodiscard]] bool DecodeLossRecord(const nlohmann::json& a_json, LossRecord& a_out);
	[[nodiscard]] bool DecodeChapterLossData(const nlohmann::json& a_json, ChapterLossData& a_out);
	[[nodiscard]] bool DecodeSuspendRecord(const nlohmann::json& a_json, SuspendRecord& a_out);

	[[nodiscard]] std::string SerializeChapterLossData(const ChapterLossData& a_data, int a_indent = -1);

	// Parses and decodes; returns false (and logs) on malformed text or structure.
	[[nodiscard]] bool ParseChapterLossData(std::string_view a_payload, ChapterLossData& a_out);

	// Best-effort salvage of a damaged blob: keeps every entry that decodes and validates, drops the rest.
	// Blobs that are not objects or lack a chapter id come back as a fresh default for a_fallbackChapterId.
	[[nodiscard]] ChapterLossData SanitizeChapterLossData(const nlohmann::json& a_json, std::string_view a_fallbackChapterId);
}
