#include "ChapterLoss/LossLogging.h"

#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace ChapterLoss::Logging
{
	spdlog::level::level_enum ParseLevel(std::string_view a_text, spdlog::level::level_enum a_fallback)
	{
		if (a_text.empty()) {
			return a_fallback;
		}
		const auto level = spdlog::level::from_str(std::string(a_text));
		// from_str maps anything it does not know to off.
		if (level == spdlog::level::off && a_text != "off") {
			return a_fallback;
		}
		return level;
	}

	bool Setup(const std::filesystem::path& a_path, spdlog::level::level_enum a_level)
	{
		if (a_path.has_parent_path()) {
			std::error_code ec;
			std::filesystem::create_directories(a_path.parent_path(), ec);
			if (ec) {
				spdlog::warn("ChapterLoss: failed to create log directory {} ({}).", a_path.parent_path().string(), ec.message());
				return false;
			}
		}

		std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
		try {
			sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(a_path.string(), true);
		} catch (const spdlog::spdlog_ex& e) {
			spdlog::warn("ChapterLoss: failed to open log file {} ({}).", a_path.string(), e.what());
			return false;
		}

		auto logger = std::make_shared<spdlog::logger>("", std::move(sink));
		spdlog::set_default_logger(std::move(logger));
		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
		spdlog::set_level(a_level);
		spdlog::flush_on(a_level);
		return true;
	}
}
