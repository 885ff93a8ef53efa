/*
 * DomainSentry - Secure Web Gateway Categorization Engine
 * Copyright (C) 2026 DomainSentry Contributors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * @file FileUtils.hpp
 * @brief POSIX file helpers used by the durable stores.
 *
 * Features:
 * - Atomic file writes with crash-safe semantics (temp + fsync + rename)
 * - Size-limited whole-file reads
 * - Cheap file identity snapshots for change detection
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <filesystem>

namespace DomainSentry {
	namespace Utils {
		namespace FileUtils {

			/// Default limit for ReadAllText (64MB)
			inline constexpr size_t DEFAULT_MAX_READ_BYTES = 64ULL * 1024 * 1024;

			/**
			 * @brief Error information for file operations.
			 *
			 * Captures both the errno value and a human-readable message.
			 */
			struct Error {
				int errnoValue = 0;         ///< errno from the failing call (0 = none)
				std::string message;        ///< Human-readable error description

				/// @brief Check if error is set
				[[nodiscard]] bool hasError() const noexcept { return errnoValue != 0 || !message.empty(); }

				/// @brief Clear the error state
				void clear() noexcept { errnoValue = 0; message.clear(); }
			};

			/**
			 * @brief Identity of a file at a point in time.
			 *
			 * Two snapshots differ when the file was replaced (inode), resized or
			 * modified (nanosecond mtime). A missing file has exists == false.
			 */
			struct FileIdentity {
				bool exists = false;
				uint64_t device = 0;
				uint64_t inode = 0;
				uint64_t size = 0;
				int64_t mtimeNs = 0;
				int64_t ctimeNs = 0;

				[[nodiscard]] bool operator==(const FileIdentity& o) const noexcept {
					return exists == o.exists && device == o.device && inode == o.inode &&
					       size == o.size && mtimeNs == o.mtimeNs && ctimeNs == o.ctimeNs;
				}
				[[nodiscard]] bool operator!=(const FileIdentity& o) const noexcept { return !(*this == o); }
			};

			/**
			 * @brief Check if a file or directory exists.
			 */
			[[nodiscard]] bool Exists(const std::filesystem::path& path) noexcept;

			/**
			 * @brief Snapshot the identity of a file (stat).
			 * @return Identity; exists == false when the file is missing or stat fails
			 */
			[[nodiscard]] FileIdentity GetFileIdentity(const std::filesystem::path& path) noexcept;

			/**
			 * @brief Read a whole file into a string.
			 * @param path File to read
			 * @param out Receives the content (cleared on failure)
			 * @param err Optional error output
			 * @param maxBytes Refuse files larger than this
			 * @return true on success
			 */
			[[nodiscard]] bool ReadAllText(const std::filesystem::path& path, std::string& out,
			                               Error* err = nullptr,
			                               size_t maxBytes = DEFAULT_MAX_READ_BYTES) noexcept;

			/**
			 * @brief Write text atomically (write to temp, fsync, then rename).
			 *
			 * The temporary file is created next to the destination so the rename
			 * never crosses filesystems. Parent directories are created as needed.
			 * A crash at any point leaves either the old or the new content.
			 *
			 * @param path Destination file
			 * @param text Content to write
			 * @param err Optional error output
			 * @return true on success
			 */
			[[nodiscard]] bool WriteAllTextAtomic(const std::filesystem::path& path, std::string_view text,
			                                      Error* err = nullptr) noexcept;

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace DomainSentry
