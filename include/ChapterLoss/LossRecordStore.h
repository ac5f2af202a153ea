#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "ChapterLoss/LossError.h"
#include "ChapterLoss/LossTypes.h"

namespace ChapterLoss
{
	// Chapter-scoped ledger of lost characters. The history is the source of truth; the
	// lost map is an index over it keyed by character id.
	class LossRecordStore
	{
	public:
		struct RepairReport
		{
			bool isValid{ true };
			std::vector<LossErrorDetails> errors{};
			std::vector<std::string> repaired{};
			std::vector<std::string> warnings{};
		};

		struct StateStatistics
		{
			std::string chapterId{};
			bool isInitialized{ false };
			std::uint32_t totalLosses{ 0 };
			std::uint32_t totalParticipants{ 0 };
			std::int64_t chapterDuration{ 0 };
			double averageLossPerTurn{ 0.0 };
			std::size_t lostCharactersSize{ 0 };
			std::size_t lossHistorySize{ 0 };
			std::size_t participatingCharactersSize{ 0 };
		};

		void InitializeChapter(std::string_view a_chapterId);
		void ResetChapterState();
		[[nodiscard]] bool IsChapterInitialized() const noexcept;
		[[nodiscard]] const std::string& GetCurrentChapterId() const noexcept { return _chapterId; }

		// Returns the recorded character. Recording an already-lost character returns the
		// original snapshot and leaves the ledger untouched.
		LostCharacter RecordLoss(const Unit& a_unit, const LossCause& a_cause);

		[[nodiscard]] bool IsLost(std::string_view a_characterId) const;
		[[nodiscard]] std::optional<LostCharacter> GetLostCharacter(std::string_view a_characterId) const;
		[[nodiscard]] std::vector<LostCharacter> GetLostCharacters() const;
		[[nodiscard]] std::vector<LossRecord> GetLossHistory() const { return _lossHistory; }
		[[nodiscard]] ChapterLossSummary GetChapterSummary() const;
		[[nodiscard]] std::uint32_t GetTotalLosses() const noexcept { return static_cast<std::uint32_t>(_lostCharacters.size()); }
		[[nodiscard]] bool IsPerfectChapter() const noexcept { return _lostCharacters.empty(); }

		[[nodiscard]] ChapterLossData Serialize() const;
		void Deserialize(const ChapterLossData& a_data);

		[[nodiscard]] bool ValidateState() const;
		[[nodiscard]] std::vector<LossErrorDetails> GetStateErrors() const;
		RepairReport ValidateAndRepair();

		void SetCurrentTurn(std::int32_t a_turn);
		[[nodiscard]] std::int32_t GetCurrentTurn() const noexcept { return _currentTurn; }
		void AddParticipatingCharacter(std::string_view a_characterId);
		[[nodiscard]] const std::set<std::string, std::less<>>& GetParticipatingCharacters() const noexcept { return _participatingCharacters; }
		[[nodiscard]] std::int64_t GetChapterStartTime() const noexcept { return _chapterStartTime; }
		[[nodiscard]] std::int64_t GetChapterDuration() const;

		[[nodiscard]] ChapterLossData CreateCheckpoint() const;
		void RestoreFromCheckpoint(const ChapterLossData& a_checkpoint);
		void MergeState(const ChapterLossData& a_other, bool a_overwriteExisting = false);

		[[nodiscard]] std::string ExportState() const;
		void ImportState(std::string_view a_json);

		[[nodiscard]] StateStatistics GetStateStatistics() const;
		void Cleanup();

	private:
		[[nodiscard]] LossContext MakeContext(std::string_view a_characterId, std::string_view a_phase) const;
		[[nodiscard]] const LostCharacter* FindLost(std::string_view a_characterId) const;
		[[nodiscard]] std::int32_t HighestRecordedTurn() const noexcept;

		std::string _chapterId{};
		std::int64_t _chapterStartTime{ 0 };
		std::int32_t _currentTurn{ 1 };
		std::map<std::string, LostCharacter, std::less<>> _lostCharacters{};
		std::vector<LossRecord> _lossHistory{};
		std::set<std::string, std::less<>> _participatingCharacters{};
	};
}
