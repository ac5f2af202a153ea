#include "ChapterLoss/KeyValueStore.h"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace ChapterLoss
{
	namespace
	{
		constexpr std::string_view kEntryExtension = ".json";

		[[nodiscard]] bool IsPlainKeyChar(char a_c) noexcept
		{
			return (a_c >= 'a' && a_c <= 'z') ||
			       (a_c >= 'A' && a_c <= 'Z') ||
			       (a_c >= '0' && a_c <= '9') ||
			       a_c == '.' || a_c == '_' || a_c == '-';
		}

		[[nodiscard]] bool WriteAllAndSync(int a_fd, std::string_view a_payload, int& a_outErrno)
		{
			const char* cursor = a_payload.data();
			std::size_t remaining = a_payload.size();
			while (remaining > 0) {
				const ::ssize_t written = ::write(a_fd, cursor, remaining);
				if (written < 0) {
					if (errno == EINTR) {
						continue;
					}
					a_outErrno = errno;
					return false;
				}
				cursor += written;
				remaining -= static_cast<std::size_t>(written);
			}

			if (::fsync(a_fd) != 0) {
				a_outErrno = errno;
				return false;
			}
			return true;
		}
	}

	FileKeyValueStore::FileKeyValueStore(std::filesystem::path a_root) :
		_root(std::move(a_root))
	{}

	std::string FileKeyValueStore::EncodeKey(std::string_view a_key)
	{
		static constexpr char kHex[] = "0123456789ABCDEF";

		std::string encoded;
		encoded.reserve(a_key.size());
		for (const char c : a_key) {
			if (IsPlainKeyChar(c)) {
				encoded.push_back(c);
				continue;
			}
			const auto byte = static_cast<unsigned char>(c);
			encoded.push_back('%');
			encoded.push_back(kHex[byte >> 4]);
			encoded.push_back(kHex[byte & 0x0F]);
		}
		// "." and ".." are not valid file names.
		if (encoded.empty() || encoded == "." || encoded == "..") {
			encoded.insert(0, "%");
		}
		return encoded;
	}

	std::filesystem::path FileKeyValueStore::PathForKey(std::string_view a_key) const
	{
		std::string fileName = EncodeKey(a_key);
		fileName.append(kEntryExtension);
		return _root / fileName;
	}

	KeyValueReadStatus FileKeyValueStore::Get(std::string_view a_key, std::string& a_outValue) const
	{
		const auto path = PathForKey(a_key);
		std::scoped_lock lk{ _ioLock };

		std::error_code ec;
		const bool exists = std::filesystem::exists(path, ec);
		if (ec) {
			spdlog::warn("ChapterLoss: failed to inspect store entry {} ({}).", path.string(), ec.message());
			return KeyValueReadStatus::kIoError;
		}
		if (!exists) {
			return KeyValueReadStatus::kMissing;
		}

		std::ifstream in(path, std::ios::binary);
		if (!in.is_open()) {
			spdlog::warn("ChapterLoss: failed to open store entry {}.", path.string());
			return KeyValueReadStatus::kIoError;
		}

		std::string payload{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
		if (in.bad()) {
			spdlog::warn("ChapterLoss: failed while reading store entry {}.", path.string());
			return KeyValueReadStatus::kIoError;
		}

		a_outValue = std::move(payload);
		return KeyValueReadStatus::kFound;
	}

	bool FileKeyValueStore::Set(std::string_view a_key, std::string_view a_value)
	{
		const auto path = PathForKey(a_key);
		std::scoped_lock lk{ _ioLock };

		std::error_code ec;
		std::filesystem::create_directories(_root, ec);
		if (ec) {
			spdlog::warn("ChapterLoss: failed to create store directory {} ({}).", _root.string(), ec.message());
			return false;
		}

		std::filesystem::path tempPath = path;
		tempPath += ".tmp";

		const int fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
		if (fd < 0) {
			spdlog::warn("ChapterLoss: failed to create temp store entry {} ({}).", tempPath.string(), std::strerror(errno));
			return false;
		}

		int writeErrno = 0;
		const bool writeOk = WriteAllAndSync(fd, a_value, writeErrno);
		const bool closeOk = ::close(fd) == 0;
		if (!writeOk || !closeOk) {
			spdlog::warn(
				"ChapterLoss: failed to write temp store entry {} ({}).",
				tempPath.string(),
				std::strerror(writeOk ? errno : writeErrno));
			std::error_code removeEc;
			std::filesystem::remove(tempPath, removeEc);
			return false;
		}

		std::error_code renameEc;
		std::filesystem::rename(tempPath, path, renameEc);
		if (renameEc) {
			spdlog::warn(
				"ChapterLoss: failed to atomically replace store entry {} ({}).",
				path.string(),
				renameEc.message());
			std::error_code removeEc;
			std::filesystem::remove(tempPath, removeEc);
			return false;
		}

		return true;
	}

	bool FileKeyValueStore::Remove(std::string_view a_key)
	{
		const auto path = PathForKey(a_key);
		std::scoped_lock lk{ _ioLock };

		std::error_code ec;
		std::filesystem::remove(path, ec);
		if (ec) {
			spdlog::warn("ChapterLoss: failed to remove store entry {} ({}).", path.string(), ec.message());
			return false;
		}
		return true;
	}

	bool FileKeyValueStore::Quarantine(std::string_view a_key)
	{
		const auto path = PathForKey(a_key);
		std::scoped_lock lk{ _ioLock };

		std::error_code existsEc;
		const bool exists = std::filesystem::exists(path, existsEc);
		if (existsEc) {
			spdlog::warn(
				"ChapterLoss: failed to inspect unreadable store entry {} before quarantine ({}).",
				path.string(),
				existsEc.message());
			return false;
		}
		if (!exists) {
			return true;
		}

		const auto now = std::chrono::system_clock::now();
		const auto unixSeconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
		const auto pid = static_cast<unsigned long>(::getpid());
		std::filesystem::path quarantinedPath = path;
		quarantinedPath += ".corrupt.";
		quarantinedPath += std::to_string(unixSeconds);
		quarantinedPath += ".";
		quarantinedPath += std::to_string(pid);

		for (std::uint32_t attempt = 0; attempt < 32u; ++attempt) {
			std::filesystem::path candidate = quarantinedPath;
			if (attempt > 0u) {
				candidate += ".";
				candidate += std::to_string(attempt);
			}

			std::error_code candidateEc;
			if (std::filesystem::exists(candidate, candidateEc)) {
				continue;
			}

			std::error_code renameEc;
			std::filesystem::rename(path, candidate, renameEc);
			if (!renameEc) {
				spdlog::warn("ChapterLoss: quarantined unreadable store entry {} -> {}.", path.string(), candidate.string());
				return true;
			}
			spdlog::warn(
				"ChapterLoss: failed to quarantine unreadable store entry {} ({}).",
				path.string(),
				renameEc.message());
			return false;
		}

		spdlog::warn(
			"ChapterLoss: failed to quarantine unreadable store entry {} (name collision limit reached).",
			path.string());
		return false;
	}
}
