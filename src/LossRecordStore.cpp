#include "ChapterLoss/LossRecordStore.h"
#include "ChapterLoss/LossContract.h"
#include "ChapterLoss/LossSerialization.h"
#include "ChapterLoss/LossValidation.h"

#include <algorithm>
#include <cmath>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		[[nodiscard]] std::string HistoryKey(const LossRecord& a_record)
		{
			return fmt::format("{}_{}", a_record.characterId, a_record.lostAt);
		}

		[[nodiscard]] LostCharacter SliceLostCharacter(const LossRecord& a_record)
		{
			return static_cast<const LostCharacter&>(a_record);
		}
	}

	void LossRecordStore::InitializeChapter(std::string_view a_chapterId)
	{
		if (IsBlank(a_chapterId)) {
			throw LossError(
				LossErrorKind::kInvalidCharacter,
				"Chapter ID cannot be empty",
				MakeContext({}, "initialize_chapter"));
		}
		if (LossContract::IsReservedChapterId(a_chapterId)) {
			throw LossError(
				LossErrorKind::kInvalidCharacter,
				fmt::format("Chapter ID uses a reserved prefix: {}", a_chapterId),
				MakeContext({}, "initialize_chapter"));
		}

		ResetChapterState();
		_chapterId = std::string(a_chapterId);
		_chapterStartTime = NowEpochMs();
		_currentTurn = 1;

		spdlog::info("ChapterLoss: chapter {} initialized.", _chapterId);
	}

	void LossRecordStore::ResetChapterState()
	{
		_lostCharacters.clear();
		_lossHistory.clear();
		_participatingCharacters.clear();
		_chapterId.clear();
		_chapterStartTime = 0;
		_currentTurn = 1;
	}

	bool LossRecordStore::IsChapterInitialized() const noexcept
	{
		return !_chapterId.empty() && _chapterStartTime > 0;
	}

	LostCharacter LossRecordStore::RecordLoss(const Unit& a_unit, const LossCause& a_cause)
	{
		if (!IsChapterInitialized()) {
			throw LossError(
				LossErrorKind::kChapterNotInitialized,
				"Chapter must be initialized before recording losses",
				MakeContext(a_unit.id, "record_loss"));
		}
		if (IsBlank(a_unit.id)) {
			throw LossError(
				LossErrorKind::kInvalidCharacter,
				"Invalid unit provided for loss recording",
				MakeContext(a_unit.id, "record_loss"));
		}
		if (!Validation::IsValidLossCause(a_cause)) {
			throw LossError(
				LossErrorKind::kInvalidLossCause,
				"Invalid loss cause provided",
				MakeContext(a_unit.id, "record_loss"));
		}

		if (const auto* existing = FindLost(a_unit.id)) {
			spdlog::warn("ChapterLoss: character {} is already lost in chapter {}.", a_unit.id, _chapterId);
			return *existing;
		}

		LostCharacter lost{};
		lost.characterId = a_unit.id;
		lost.name = IsBlank(a_unit.name) ? MakeDefaultCharacterName(a_unit.id) : a_unit.name;
		lost.lostAt = std::max(NowEpochMs(), _chapterStartTime);
		lost.turn = std::max(_currentTurn, HighestRecordedTurn());
		lost.cause = a_cause;
		lost.level = a_unit.level >= 1 ? a_unit.level : 1;
		lost.wasRecruited = a_unit.wasRecruited;
		lost.position = a_unit.position;

		LossRecord record{};
		static_cast<LostCharacter&>(record) = lost;
		record.chapterId = _chapterId;
		record.stageId = MakeStageId(_chapterId, lost.turn);
		record.recoverable = false;

		_lostCharacters.emplace(lost.characterId, lost);
		_lossHistory.push_back(std::move(record));
		_participatingCharacters.insert(lost.characterId);

		spdlog::info(
			"ChapterLoss: recorded loss of {} ({}) in chapter {} on turn {}: {}.",
			lost.name,
			lost.characterId,
			_chapterId,
			lost.turn,
			lost.cause.description);
		return lost;
	}

	bool LossRecordStore::IsLost(std::string_view a_characterId) const
	{
		return FindLost(a_characterId) != nullptr;
	}

	std::optional<LostCharacter> LossRecordStore::GetLostCharacter(std::string_view a_characterId) const
	{
		if (const auto* lost = FindLost(a_characterId)) {
			return *lost;
		}
		return std::nullopt;
	}

	std::vector<LostCharacter> LossRecordStore::GetLostCharacters() const
	{
		// History order first so callers see losses in the order they happened.
		std::vector<LostCharacter> result;
		result.reserve(_lostCharacters.size());
		std::unordered_set<std::string> emitted;
		for (const auto& record : _lossHistory) {
			if (emitted.count(record.characterId) != 0) {
				continue;
			}
			if (const auto* lost = FindLost(record.characterId)) {
				result.push_back(*lost);
				emitted.insert(record.characterId);
			}
		}
		for (const auto& [id, lost] : _lostCharacters) {
			if (emitted.count(id) == 0) {
				result.push_back(lost);
			}
		}
		return result;
	}

	ChapterLossSummary LossRecordStore::GetChapterSummary() const
	{
		if (!IsChapterInitialized()) {
			throw LossError(
				LossErrorKind::kChapterNotInitialized,
				"Chapter must be initialized to get summary",
				MakeContext({}, "chapter_summary"));
		}

		ChapterLossSummary summary{};
		summary.chapterId = _chapterId;
		summary.chapterName = MakeChapterName(_chapterId);
		summary.totalCharacters = static_cast<std::uint32_t>(_participatingCharacters.size());
		summary.lostCharacters = GetLostCharacters();
		for (const auto& id : _participatingCharacters) {
			if (!IsLost(id)) {
				summary.survivedCharacters.push_back(id);
			}
		}
		summary.chapterDuration = GetChapterDuration();
		summary.totalTurns = _currentTurn;
		summary.isPerfectClear = summary.lostCharacters.empty();
		summary.completedAt = NowEpochMs();

		if (!Validation::IsValidChapterLossSummary(summary)) {
			throw LossError(
				LossErrorKind::kSystemError,
				"Generated invalid chapter summary",
				MakeContext({}, "chapter_summary"));
		}
		return summary;
	}

	ChapterLossData LossRecordStore::Serialize() const
	{
		if (!IsChapterInitialized()) {
			throw LossError(
				LossErrorKind::kChapterNotInitialized,
				"Chapter must be initialized to serialize",
				MakeContext({}, "serialize"));
		}

		ChapterLossData data{};
		data.chapterId = _chapterId;
		for (const auto& [id, lost] : _lostCharacters) {
			data.lostCharacters.emplace(id, lost);
		}
		data.lossHistory = _lossHistory;
		data.chapterStartTime = _chapterStartTime;
		data.version = std::string(kSchemaVersion);

		if (!Validation::IsValidChapterLossData(data)) {
			throw LossError(
				LossErrorKind::kSystemError,
				"Generated invalid serialized data",
				MakeContext({}, "serialize"));
		}
		return data;
	}

	void LossRecordStore::Deserialize(const ChapterLossData& a_data)
	{
		if (!Validation::IsValidChapterLossData(a_data)) {
			LossContext context{};
			context.chapterId = a_data.chapterId;
			context.phase = "deserialize";
			throw LossError(LossErrorKind::kSaveDataCorrupted, "Invalid chapter loss data format", std::move(context));
		}

		_chapterId = a_data.chapterId;
		_chapterStartTime = a_data.chapterStartTime;
		_lossHistory = a_data.lossHistory;
		_lostCharacters.clear();
		for (const auto& [id, lost] : a_data.lostCharacters) {
			_lostCharacters.emplace(id, lost);
		}

		_participatingCharacters.clear();
		for (const auto& record : _lossHistory) {
			_participatingCharacters.insert(record.characterId);
		}
		_currentTurn = std::max(1, HighestRecordedTurn());

		spdlog::info(
			"ChapterLoss: deserialized chapter {} with {} losses.",
			_chapterId,
			_lostCharacters.size());
	}

	bool LossRecordStore::ValidateState() const
	{
		return GetStateErrors().empty();
	}

	std::vector<LossErrorDetails> LossRecordStore::GetStateErrors() const
	{
		std::vector<LossErrorDetails> errors;
		if (!IsChapterInitialized()) {
			errors.push_back(MakeErrorDetails(
				LossErrorKind::kChapterNotInitialized,
				"Chapter is not initialized",
				MakeContext({}, "validate_state")));
			return errors;
		}

		for (const auto& [id, lost] : _lostCharacters) {
			if (!Validation::IsValidLostCharacter(lost) || lost.characterId != id) {
				errors.push_back(MakeErrorDetails(
					LossErrorKind::kInvalidCharacter,
					fmt::format("Invalid lost character data for {}", id),
					MakeContext(id, "validate_state")));
			}
		}

		std::unordered_set<std::string> historyIds;
		for (const auto& record : _lossHistory) {
			historyIds.insert(record.characterId);
			if (!Validation::IsValidLossRecord(record)) {
				errors.push_back(MakeErrorDetails(
					LossErrorKind::kSystemError,
					fmt::format("Invalid loss record for {}", record.characterId),
					MakeContext(record.characterId, "validate_state")));
			}
		}

		for (const auto& [id, lost] : _lostCharacters) {
			if (historyIds.count(id) == 0) {
				errors.push_back(MakeErrorDetails(
					LossErrorKind::kSystemError,
					fmt::format("Missing loss history record for {}", id),
					MakeContext(id, "validate_state")));
			}
		}
		for (const auto& id : historyIds) {
			if (!FindLost(id)) {
				errors.push_back(MakeErrorDetails(
					LossErrorKind::kSystemError,
					fmt::format("Missing lost character entry for {}", id),
					MakeContext(id, "validate_state")));
			}
		}

		return errors;
	}

	LossRecordStore::RepairReport LossRecordStore::ValidateAndRepair()
	{
		RepairReport report{};
		if (!IsChapterInitialized()) {
			report.errors.push_back(MakeErrorDetails(
				LossErrorKind::kChapterNotInitialized,
				"Chapter is not initialized",
				MakeContext({}, "validate_and_repair")));
			report.isValid = false;
			return report;
		}

		// Lost-map entries that cannot be trusted are dropped; history may restore them below.
		for (auto it = _lostCharacters.begin(); it != _lostCharacters.end();) {
			const auto& [id, lost] = *it;
			if (!Validation::IsValidLostCharacter(lost) || lost.characterId != id) {
				report.errors.push_back(MakeErrorDetails(
					LossErrorKind::kInvalidCharacter,
					fmt::format("Invalid lost character data for {}", id),
					MakeContext(id, "validate_and_repair")));
				report.repaired.push_back(fmt::format("Removed invalid lost character {}", id));
				it = _lostCharacters.erase(it);
				continue;
			}
			if (_participatingCharacters.insert(id).second) {
				report.repaired.push_back(fmt::format("Added missing participating character entry for {}", id));
			}
			++it;
		}

		const std::size_t historyBefore = _lossHistory.size();
		std::vector<LossRecord> validHistory;
		validHistory.reserve(historyBefore);
		for (auto& record : _lossHistory) {
			if (Validation::IsValidLossRecord(record)) {
				validHistory.push_back(std::move(record));
			} else {
				report.warnings.push_back(fmt::format("Removed invalid loss record for {}", record.characterId));
			}
		}
		_lossHistory = std::move(validHistory);
		if (_lossHistory.size() != historyBefore) {
			report.repaired.push_back(fmt::format("Cleaned up {} invalid loss records", historyBefore - _lossHistory.size()));
		}

		std::unordered_set<std::string> historyIds;
		for (const auto& record : _lossHistory) {
			historyIds.insert(record.characterId);
		}

		for (const auto& [id, lost] : _lostCharacters) {
			if (historyIds.count(id) != 0) {
				continue;
			}
			LossRecord synthetic{};
			static_cast<LostCharacter&>(synthetic) = lost;
			synthetic.chapterId = _chapterId;
			synthetic.stageId = MakeStageId(_chapterId, lost.turn);
			synthetic.recoverable = false;
			_lossHistory.push_back(std::move(synthetic));
			historyIds.insert(id);
			report.repaired.push_back(fmt::format("Added missing history record for {}", id));
		}

		for (const auto& record : _lossHistory) {
			if (FindLost(record.characterId)) {
				continue;
			}
			_lostCharacters.emplace(record.characterId, SliceLostCharacter(record));
			report.repaired.push_back(fmt::format("Restored missing lost character entry for {}", record.characterId));
			if (_participatingCharacters.insert(record.characterId).second) {
				report.repaired.push_back(fmt::format("Added missing participating character entry for {}", record.characterId));
			}
		}

		const std::int64_t now = std::max(NowEpochMs(), _chapterStartTime);
		std::uint32_t timestampIssues = 0;
		const auto clampLostAt = [&](LostCharacter& a_lost) {
			if (a_lost.lostAt > now || a_lost.lostAt < _chapterStartTime) {
				a_lost.lostAt = std::clamp(a_lost.lostAt, _chapterStartTime, now);
				++timestampIssues;
			}
		};
		for (auto& [id, lost] : _lostCharacters) {
			clampLostAt(lost);
		}
		for (auto& record : _lossHistory) {
			clampLostAt(record);
		}
		if (timestampIssues > 0) {
			report.repaired.push_back(fmt::format("Fixed {} invalid timestamps", timestampIssues));
		}

		_currentTurn = std::max(_currentTurn, HighestRecordedTurn());
		report.isValid = report.errors.empty();

		if (!report.repaired.empty()) {
			spdlog::warn(
				"ChapterLoss: repaired chapter {} state ({} repairs, {} warnings).",
				_chapterId,
				report.repaired.size(),
				report.warnings.size());
		}
		return report;
	}

	void LossRecordStore::SetCurrentTurn(std::int32_t a_turn)
	{
		if (a_turn < 1) {
			spdlog::warn("ChapterLoss: ignoring invalid turn {}.", a_turn);
			return;
		}
		_currentTurn = a_turn;
	}

	void LossRecordStore::AddParticipatingCharacter(std::string_view a_characterId)
	{
		if (IsBlank(a_characterId)) {
			return;
		}
		_participatingCharacters.emplace(a_characterId);
	}

	std::int64_t LossRecordStore::GetChapterDuration() const
	{
		if (_chapterStartTime <= 0) {
			return 0;
		}
		return std::max<std::int64_t>(0, NowEpochMs() - _chapterStartTime);
	}

	ChapterLossData LossRecordStore::CreateCheckpoint() const
	{
		if (!IsChapterInitialized()) {
			throw LossError(
				LossErrorKind::kChapterNotInitialized,
				"Chapter must be initialized to create checkpoint",
				MakeContext({}, "checkpoint"));
		}
		return Serialize();
	}

	void LossRecordStore::RestoreFromCheckpoint(const ChapterLossData& a_checkpoint)
	{
		if (!Validation::IsValidChapterLossData(a_checkpoint)) {
			LossContext context{};
			context.chapterId = a_checkpoint.chapterId;
			context.phase = "restore_checkpoint";
			throw LossError(LossErrorKind::kSaveDataCorrupted, "Invalid checkpoint data format", std::move(context));
		}
		Deserialize(a_checkpoint);
		spdlog::info("ChapterLoss: state restored from checkpoint for chapter {}.", a_checkpoint.chapterId);
	}

	void LossRecordStore::MergeState(const ChapterLossData& a_other, bool a_overwriteExisting)
	{
		if (!Validation::IsValidChapterLossData(a_other)) {
			LossContext context{};
			context.chapterId = a_other.chapterId;
			context.phase = "merge_state";
			throw LossError(LossErrorKind::kSaveDataCorrupted, "Invalid merge data format", std::move(context));
		}

		if (!IsChapterInitialized()) {
			Deserialize(a_other);
			return;
		}

		for (const auto& [id, lost] : a_other.lostCharacters) {
			if (const auto it = _lostCharacters.find(id); it == _lostCharacters.end()) {
				_lostCharacters.emplace(id, lost);
				_participatingCharacters.insert(id);
			} else if (a_overwriteExisting) {
				it->second = lost;
				_participatingCharacters.insert(id);
			}
		}

		std::unordered_set<std::string> existing;
		for (const auto& record : _lossHistory) {
			existing.insert(HistoryKey(record));
		}
		for (const auto& record : a_other.lossHistory) {
			if (existing.insert(HistoryKey(record)).second) {
				_lossHistory.push_back(record);
				_participatingCharacters.insert(record.characterId);
			}
		}

		if (a_other.chapterStartTime < _chapterStartTime) {
			_chapterStartTime = a_other.chapterStartTime;
		}
		_currentTurn = std::max(_currentTurn, HighestRecordedTurn());

		spdlog::info("ChapterLoss: merged state from chapter {} into {}.", a_other.chapterId, _chapterId);
	}

	std::string LossRecordStore::ExportState() const
	{
		return LossSerialization::SerializeChapterLossData(Serialize(), 2);
	}

	void LossRecordStore::ImportState(std::string_view a_json)
	{
		ChapterLossData data{};
		if (!LossSerialization::ParseChapterLossData(a_json, data)) {
			throw LossError(
				LossErrorKind::kSaveDataCorrupted,
				"Failed to import state from JSON",
				MakeContext({}, "import_state"));
		}
		Deserialize(data);
	}

	LossRecordStore::StateStatistics LossRecordStore::GetStateStatistics() const
	{
		StateStatistics stats{};
		stats.chapterId = _chapterId;
		stats.isInitialized = IsChapterInitialized();
		stats.totalLosses = GetTotalLosses();
		stats.totalParticipants = static_cast<std::uint32_t>(_participatingCharacters.size());
		stats.chapterDuration = GetChapterDuration();
		if (_currentTurn > 0) {
			const double perTurn = static_cast<double>(_lostCharacters.size()) / static_cast<double>(_currentTurn);
			stats.averageLossPerTurn = std::round(perTurn * 100.0) / 100.0;
		}
		stats.lostCharactersSize = _lostCharacters.size();
		stats.lossHistorySize = _lossHistory.size();
		stats.participatingCharactersSize = _participatingCharacters.size();
		return stats;
	}

	void LossRecordStore::Cleanup()
	{
		const std::string chapterId = _chapterId;
		ResetChapterState();
		if (!chapterId.empty()) {
			spdlog::debug("ChapterLoss: cleaned up state for chapter {}.", chapterId);
		}
	}

	LossContext LossRecordStore::MakeContext(std::string_view a_characterId, std::string_view a_phase) const
	{
		LossContext context{};
		context.characterId = std::string(a_characterId);
		context.chapterId = _chapterId;
		context.turn = _currentTurn;
		context.phase = std::string(a_phase);
		return context;
	}

	const LostCharacter* LossRecordStore::FindLost(std::string_view a_characterId) const
	{
		if (IsBlank(a_characterId)) {
			return nullptr;
		}
		const auto it = _lostCharacters.find(a_characterId);
		return it != _lostCharacters.end() ? &it->second : nullptr;
	}

	std::int32_t LossRecordStore::HighestRecordedTurn() const noexcept
	{
		std::int32_t highest = 0;
		for (const auto& record : _lossHistory) {
			highest = std::max(highest, record.turn);
		}
		return highest;
	}
}
