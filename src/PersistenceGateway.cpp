#include "ChapterLoss/PersistenceGateway.h"
#include "ChapterLoss/LossContract.h"
#include "ChapterLoss/LossSerialization.h"
#include "ChapterLoss/LossValidation.h"

#include <exception>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		[[nodiscard]] bool IsUsableChapterId(std::string_view a_chapterId)
		{
			return !IsBlank(a_chapterId) && !LossContract::IsReservedChapterId(a_chapterId);
		}

		[[nodiscard]] std::string ChapterIdProblem(std::string_view a_chapterId)
		{
			if (IsBlank(a_chapterId)) {
				return "Chapter ID cannot be empty";
			}
			return fmt::format("Chapter ID uses a reserved prefix: {}", a_chapterId);
		}
	}

	PersistenceGateway::PersistenceGateway(IKeyValueStore& a_store, ILossRecoveryHandler* a_recovery) :
		_store(a_store),
		_recovery(a_recovery)
	{}

	SaveResult PersistenceGateway::Save(std::string_view a_chapterId, const ChapterLossData& a_data)
	{
		SaveResult result{};
		if (!IsUsableChapterId(a_chapterId)) {
			result.message = ChapterIdProblem(a_chapterId);
			return result;
		}
		if (a_data.chapterId != a_chapterId || !Validation::IsValidChapterLossData(a_data)) {
			result.message = fmt::format("Refusing to save invalid chapter loss data for {}", a_chapterId);
			spdlog::error("ChapterLoss: {}.", result.message);
			return result;
		}

		std::string payload;
		try {
			payload = LossSerialization::SerializeChapterLossData(a_data);
		} catch (const std::exception& e) {
			result.message = fmt::format("Failed to serialize chapter loss data: {}", e.what());
			spdlog::error("ChapterLoss: {}.", result.message);
			return result;
		}
		result.dataSize = payload.size();

		const bool primaryOk = _store.Set(LossContract::PrimaryKey(a_chapterId), payload);
		// Backup is written regardless of the primary outcome and never fails the save.
		result.backupWritten = _store.Set(LossContract::BackupKey(a_chapterId), payload);
		if (!result.backupWritten) {
			spdlog::warn("ChapterLoss: failed to write backup for chapter {}.", a_chapterId);
		}

		if (!primaryOk) {
			result.message = fmt::format("Failed to write chapter loss data for {}", a_chapterId);
			spdlog::error("ChapterLoss: {}.", result.message);
			return result;
		}

		result.success = true;
		result.message = "Chapter loss state saved successfully";
		spdlog::debug("ChapterLoss: saved chapter {} ({} bytes).", a_chapterId, result.dataSize);
		return result;
	}

	LoadResult PersistenceGateway::Load(std::string_view a_chapterId)
	{
		if (!IsUsableChapterId(a_chapterId)) {
			LoadResult result{};
			result.message = ChapterIdProblem(a_chapterId);
			return result;
		}

		std::string payload;
		switch (_store.Get(LossContract::PrimaryKey(a_chapterId), payload)) {
		case KeyValueReadStatus::kMissing:
			{
				LoadResult result{};
				result.success = true;
				result.wasEmpty = true;
				result.source = LoadSource::kEmpty;
				result.message = "No saved data found";
				return result;
			}
		case KeyValueReadStatus::kIoError:
			spdlog::warn("ChapterLoss: primary save for chapter {} is unreadable.", a_chapterId);
			return Recover(a_chapterId, {});
		case KeyValueReadStatus::kFound:
			break;
		}

		ChapterLossData data{};
		if (!TryDecode(a_chapterId, payload, data)) {
			return Recover(a_chapterId, payload);
		}

		LoadResult result{};
		result.success = true;
		result.source = LoadSource::kPrimary;
		result.data = std::move(data);
		result.message = "Chapter loss state loaded successfully";
		return result;
	}

	bool PersistenceGateway::Remove(std::string_view a_chapterId)
	{
		if (!IsUsableChapterId(a_chapterId)) {
			return false;
		}
		const bool primaryOk = _store.Remove(LossContract::PrimaryKey(a_chapterId));
		const bool backupOk = _store.Remove(LossContract::BackupKey(a_chapterId));
		if (!primaryOk || !backupOk) {
			spdlog::warn("ChapterLoss: failed to clear saved data for chapter {}.", a_chapterId);
		}
		return primaryOk && backupOk;
	}

	bool PersistenceGateway::HasSaveData(std::string_view a_chapterId) const
	{
		return IsUsableChapterId(a_chapterId) && KeyExists(LossContract::PrimaryKey(a_chapterId));
	}

	std::optional<SaveDataInfo> PersistenceGateway::GetSaveDataInfo(std::string_view a_chapterId) const
	{
		std::string payload;
		if (!IsUsableChapterId(a_chapterId) || _store.Get(LossContract::PrimaryKey(a_chapterId), payload) != KeyValueReadStatus::kFound) {
			return std::nullopt;
		}

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(payload);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: failed to read save data info for chapter {} ({}).", a_chapterId, e.what());
			return std::nullopt;
		}
		if (!j.is_object()) {
			return std::nullopt;
		}

		SaveDataInfo info{};
		info.chapterId = std::string(a_chapterId);
		const auto lost = j.find(std::string(LossContract::kFieldLostCharacters));
		if (lost != j.end() && lost->is_object()) {
			info.lossCount = static_cast<std::uint32_t>(lost->size());
		}
		const auto start = j.find(std::string(LossContract::kFieldChapterStartTime));
		if (start != j.end() && start->is_number_integer()) {
			info.lastSaved = start->get<std::int64_t>();
		}
		info.dataSize = payload.size();
		info.hasBackup = KeyExists(LossContract::BackupKey(a_chapterId));
		return info;
	}

	bool PersistenceGateway::SaveSuspendRecord(const SuspendRecord& a_record)
	{
		if (!IsUsableChapterId(a_record.chapterId)) {
			return false;
		}
		std::string payload;
		try {
			payload = LossSerialization::EncodeSuspendRecord(a_record).dump();
		} catch (const std::exception& e) {
			spdlog::error("ChapterLoss: failed to serialize suspend record for {} ({}).", a_record.chapterId, e.what());
			return false;
		}
		if (!_store.Set(LossContract::SuspendKey(a_record.chapterId), payload)) {
			spdlog::error("ChapterLoss: failed to write suspend record for chapter {}.", a_record.chapterId);
			return false;
		}
		return true;
	}

	std::optional<SuspendRecord> PersistenceGateway::LoadSuspendRecord(std::string_view a_chapterId) const
	{
		std::string payload;
		if (!IsUsableChapterId(a_chapterId) || _store.Get(LossContract::SuspendKey(a_chapterId), payload) != KeyValueReadStatus::kFound) {
			return std::nullopt;
		}

		nlohmann::json j;
		try {
			j = nlohmann::json::parse(payload);
		} catch (const std::exception& e) {
			spdlog::warn("ChapterLoss: failed to parse suspend record for chapter {} ({}).", a_chapterId, e.what());
			return std::nullopt;
		}

		SuspendRecord record{};
		if (!LossSerialization::DecodeSuspendRecord(j, record) || record.chapterId != a_chapterId) {
			spdlog::warn("ChapterLoss: suspend record for chapter {} has an invalid structure.", a_chapterId);
			return std::nullopt;
		}
		return record;
	}

	bool PersistenceGateway::RemoveSuspendRecord(std::string_view a_chapterId)
	{
		return IsUsableChapterId(a_chapterId) && _store.Remove(LossContract::SuspendKey(a_chapterId));
	}

	bool PersistenceGateway::HasSuspendRecord(std::string_view a_chapterId) const
	{
		return IsUsableChapterId(a_chapterId) && KeyExists(LossContract::SuspendKey(a_chapterId));
	}

	bool PersistenceGateway::TryDecode(std::string_view a_chapterId, std::string_view a_payload, ChapterLossData& a_out) const
	{
		ChapterLossData data{};
		if (!LossSerialization::ParseChapterLossData(a_payload, data)) {
			return false;
		}
		if (data.chapterId != a_chapterId) {
			spdlog::warn(
				"ChapterLoss: save data under chapter {} belongs to chapter {}.",
				a_chapterId,
				data.chapterId);
			return false;
		}
		if (!Validation::IsConsistentChapterLossData(data)) {
			spdlog::warn("ChapterLoss: save data for chapter {} has a lost map that disagrees with its history.", a_chapterId);
			return false;
		}
		a_out = std::move(data);
		return true;
	}

	LoadResult PersistenceGateway::Recover(std::string_view a_chapterId, std::string_view a_primaryPayload)
	{
		spdlog::warn("ChapterLoss: attempting to recover corrupted save data for chapter {}.", a_chapterId);

		if (_recovery) {
			std::optional<ChapterLossData> repaired;
			try {
				repaired = _recovery->RepairSaveData(a_chapterId, a_primaryPayload);
			} catch (const std::exception& e) {
				spdlog::warn("ChapterLoss: recovery handler failed for chapter {} ({}).", a_chapterId, e.what());
			}
			if (repaired && repaired->chapterId == a_chapterId && Validation::IsValidChapterLossData(*repaired)) {
				const auto saved = Save(a_chapterId, *repaired);
				if (!saved.success) {
					spdlog::warn("ChapterLoss: repaired data for chapter {} could not be re-persisted.", a_chapterId);
				}
				spdlog::info("ChapterLoss: save data for chapter {} repaired by recovery handler.", a_chapterId);

				LoadResult result{};
				result.success = true;
				result.source = LoadSource::kRepaired;
				result.data = std::move(repaired);
				result.message = fmt::format("Save data recovered using error handler for chapter {}", a_chapterId);
				return result;
			}
		}

		std::string backupPayload;
		const auto backupStatus = _store.Get(LossContract::BackupKey(a_chapterId), backupPayload);
		if (backupStatus == KeyValueReadStatus::kFound) {
			ChapterLossData backup{};
			if (TryDecode(a_chapterId, backupPayload, backup)) {
				if (!_store.Set(LossContract::PrimaryKey(a_chapterId), backupPayload)) {
					spdlog::warn("ChapterLoss: restored backup for chapter {} could not be promoted.", a_chapterId);
				}
				spdlog::info("ChapterLoss: restored chapter {} from backup.", a_chapterId);

				LoadResult result{};
				result.success = true;
				result.source = LoadSource::kBackup;
				result.data = std::move(backup);
				result.message = "Successfully restored from backup data";
				return result;
			}
			spdlog::warn("ChapterLoss: backup for chapter {} is also corrupted.", a_chapterId);
		}

		spdlog::warn("ChapterLoss: no usable backup, resetting chapter {} to default state.", a_chapterId);
		if (!_store.Quarantine(LossContract::PrimaryKey(a_chapterId))) {
			spdlog::warn("ChapterLoss: failed to discard corrupted primary save for chapter {}.", a_chapterId);
		}
		if (backupStatus != KeyValueReadStatus::kMissing && !_store.Quarantine(LossContract::BackupKey(a_chapterId))) {
			spdlog::warn("ChapterLoss: failed to discard corrupted backup for chapter {}.", a_chapterId);
		}

		LoadResult result{};
		result.source = LoadSource::kReset;
		result.data = CreateDefaultChapterLossData(a_chapterId);
		const auto saved = Save(a_chapterId, *result.data);
		if (!saved.success) {
			result.message = fmt::format("Failed to recover corrupted save data: {}", saved.message);
			spdlog::error("ChapterLoss: {}.", result.message);
			return result;
		}

		result.success = true;
		result.message = "Corrupted save data recovered by resetting to default state";
		return result;
	}

	bool PersistenceGateway::KeyExists(std::string_view a_key) const
	{
		std::string ignored;
		return _store.Get(a_key, ignored) == KeyValueReadStatus::kFound;
	}
}
