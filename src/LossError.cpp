#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossTypes.h"

#include <utility>

namespace ChapterLoss
{
	LossErrorDetails MakeErrorDetails(LossErrorKind a_kind, std::string a_message, LossContext a_context)
	{
		LossErrorDetails details{};
		details.kind = a_kind;
		details.message = std::move(a_message);
		details.context = std::move(a_context);
		details.timestamp = NowEpochMs();
		details.recoverable = IsRecoverable(a_kind);
		details.suggestedAction = std::string(SuggestedAction(a_kind));
		return details;
	}

	LossError::LossError(LossErrorDetails a_details) :
		std::runtime_error(a_details.message),
		_details(std::move(a_details))
	{}

	LossError::LossError(LossErrorKind a_kind, std::string a_message, LossContext a_context) :
		LossError(MakeErrorDetails(a_kind, std::move(a_message), std::move(a_context)))
	{}
}
