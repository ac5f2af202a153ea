#include "ChapterLoss/LossOrchestrator.h"
#include "ChapterLoss/PartyCompositionValidator.h"
#include "ChapterLoss/PersistenceGateway.h"

using namespace ChapterLoss;

static_assert(ToString(LoadSource::kBackup) == "backup_restore" && ToString(LoadSource::kReset) == "reset_to_default",
	"ToString(LoadSource): recovery tier labels");

static_assert(ToString(LoadSource::kPrimary) == "primary" && ToString(LoadSource::kEmpty) == "empty",
	"ToString(LoadSource): plain load labels");

static_assert(ToString(PartyIssueType::kLostCharacter) == "lost_character" &&
                  ToString(PartyIssueType::kTooManyMembers) == "too_many_members" &&
                  ToString(PartyIssueType::kMissingRole) == "missing_role",
	"ToString(PartyIssueType): issue codes");

static_assert(ToString(IssueSeverity::kError) == "error" && ToString(IssueSeverity::kLow) == "low",
	"ToString(IssueSeverity): severity labels");

static_assert(ToString(ChapterPhase::kProcessingLoss) == "processing_loss" && ToString(ChapterPhase::kCompleted) == "completed",
	"ToString(ChapterPhase): phase labels");

static_assert(kReplacementPriority == 10, "kReplacementPriority: replacements outrank level-based suggestions below 10");

static_assert(kGameOverReasonAllLost == "all_characters_lost", "kGameOverReasonAllLost: game over reason code");
