#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ChapterLoss
{
	enum class LossErrorKind : std::uint8_t
	{
		kChapterNotInitialized = 0,
		kInvalidCharacter,
		kInvalidLossCause,
		kAlreadyLost,
		kLossProcessingFailed,
		kSaveDataCorrupted,
		kSystemError
	};

	struct LossContext
	{
		std::string characterId{};
		std::string chapterId{};
		std::int32_t turn{ 0 };
		std::string phase{};
	};

	struct LossErrorDetails
	{
		LossErrorKind kind{ LossErrorKind::kSystemError };
		std::string message{};
		LossContext context{};
		std::int64_t timestamp{ 0 };
		bool recoverable{ true };
		std::string suggestedAction{};
	};

	[[nodiscard]] constexpr std::string_view ToString(LossErrorKind a_kind) noexcept
	{
		switch (a_kind) {
		case LossErrorKind::kChapterNotInitialized:
			return "chapter_not_initialized";
		case LossErrorKind::kInvalidCharacter:
			return "invalid_character";
		case LossErrorKind::kInvalidLossCause:
			return "invalid_loss_cause";
		case LossErrorKind::kAlreadyLost:
			return "already_lost";
		case LossErrorKind::kLossProcessingFailed:
			return "loss_processing_failed";
		case LossErrorKind::kSaveDataCorrupted:
			return "save_data_corrupted";
		case LossErrorKind::kSystemError:
			return "system_error";
		}
		return "system_error";
	}

	// Only corruption that survived every recovery tier is unrecoverable.
	[[nodiscard]] constexpr bool IsRecoverable(LossErrorKind a_kind) noexcept
	{
		return a_kind != LossErrorKind::kSaveDataCorrupted;
	}

	[[nodiscard]] constexpr std::string_view SuggestedAction(LossErrorKind a_kind) noexcept
	{
		switch (a_kind) {
		case LossErrorKind::kChapterNotInitialized:
			return "Initialize chapter before performing operations";
		case LossErrorKind::kInvalidCharacter:
			return "Verify character data is valid and complete";
		case LossErrorKind::kAlreadyLost:
			return "Check character loss status before processing loss";
		case LossErrorKind::kLossProcessingFailed:
			return "Check system logs and retry loss processing";
		case LossErrorKind::kSaveDataCorrupted:
			return "Reset chapter state or restore from backup";
		case LossErrorKind::kInvalidLossCause:
			return "Provide valid loss cause with required fields";
		case LossErrorKind::kSystemError:
			break;
		}
		return "Check system logs for detailed error information";
	}

	[[nodiscard]] LossErrorDetails MakeErrorDetails(LossErrorKind a_kind, std::string a_message, LossContext a_context);

	class LossError : public std::runtime_error
	{
	public:
		explicit LossError(LossErrorDetails a_details);
		LossError(LossErrorKind a_kind, std::string a_message, LossContext a_context = {});

		[[nodiscard]] LossErrorKind Kind() const noexcept { return _details.kind; }
		[[nodiscard]] const LossErrorDetails& Details() const noexcept { return _details; }

	private:
		LossErrorDetails _details;
	};
}
