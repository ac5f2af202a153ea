#pragma once

#include <filesystem>
#include <string_view>

#include <spdlog/common.h>

namespace ChapterLoss::Logging
{
	// Unknown names fall back to a_fallback.
	[[nodiscard]] spdlog::level::level_enum ParseLevel(
		std::string_view a_text,
		spdlog::level::level_enum a_fallback = spdlog::level::info);

	// Installs a file-backed default logger. On failure the previous default logger stays in place.
	bool Setup(const std::filesystem::path& a_path, spdlog::level::level_enum a_level);
}
