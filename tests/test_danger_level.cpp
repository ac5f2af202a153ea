#include "ChapterLoss/LossConfig.h"
#include "ChapterLoss/LossTypes.h"

using ChapterLoss::CalculateDangerLevel;
using ChapterLoss::DangerLevel;
using ChapterLoss::DangerThresholds;
using ChapterLoss::MakeDangerThresholds;
using ChapterLoss::OrchestratorConfig;

static_assert(CalculateDangerLevel(0, 100) == DangerLevel::kCritical,
	"CalculateDangerLevel: zero HP is critical");

static_assert(CalculateDangerLevel(-5, 100) == DangerLevel::kCritical,
	"CalculateDangerLevel: negative HP is critical");

static_assert(CalculateDangerLevel(25, 100) == DangerLevel::kCritical,
	"CalculateDangerLevel: critical band includes its upper bound");

static_assert(CalculateDangerLevel(26, 100) == DangerLevel::kHigh,
	"CalculateDangerLevel: just above critical is high");

static_assert(CalculateDangerLevel(50, 100) == DangerLevel::kHigh,
	"CalculateDangerLevel: high band includes its upper bound");

static_assert(CalculateDangerLevel(75, 100) == DangerLevel::kMedium,
	"CalculateDangerLevel: medium band includes its upper bound");

static_assert(CalculateDangerLevel(90, 100) == DangerLevel::kLow,
	"CalculateDangerLevel: low band includes its upper bound");

static_assert(CalculateDangerLevel(91, 100) == DangerLevel::kNone,
	"CalculateDangerLevel: healthy unit has no danger");

static_assert(CalculateDangerLevel(100, 100) == DangerLevel::kNone,
	"CalculateDangerLevel: full HP has no danger");

static_assert(CalculateDangerLevel(1, 3) == DangerLevel::kHigh,
	"CalculateDangerLevel: fractional ratios compare without rounding");

static_assert(CalculateDangerLevel(30, 0) == DangerLevel::kNone,
	"CalculateDangerLevel: unknown max HP treats current HP as full");

static_assert([] {
	DangerThresholds thresholds{};
	thresholds.criticalPercent = 10;
	return CalculateDangerLevel(20, 100, thresholds) == DangerLevel::kHigh &&
	       CalculateDangerLevel(10, 100, thresholds) == DangerLevel::kCritical;
}(),
	"CalculateDangerLevel: honours a custom critical threshold");

static_assert([] {
	constexpr auto thresholds = MakeDangerThresholds(OrchestratorConfig{});
	return thresholds.criticalPercent == 25 && thresholds.highPercent == 50 &&
	       thresholds.mediumPercent == 75 && thresholds.lowPercent == 90;
}(),
	"MakeDangerThresholds: defaults map to 25/50/75/90");

static_assert([] {
	OrchestratorConfig config{};
	config.criticalHPThreshold = 40;
	config.highHPThreshold = 80;
	const auto thresholds = MakeDangerThresholds(config);
	return thresholds.highPercent == 80 && thresholds.mediumPercent == 80 && thresholds.lowPercent == 90;
}(),
	"MakeDangerThresholds: a wide high band pushes medium up and keeps bands ordered");
