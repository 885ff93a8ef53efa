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
 * @file JSONUtils.hpp
 * @brief nlohmann::json helpers: bounded parsing, file load/save with atomic
 *        replacement and typed getters.
 */
#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <cstdint>

#include <nlohmann/json.hpp>

namespace DomainSentry {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			// ============================================================================
			// Limits
			// ============================================================================

			/// Maximum nesting depth to prevent stack overflow on hostile input
			inline constexpr size_t MAX_JSON_DEPTH = 256;

			/// Default file size limit for LoadFromFile (32MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information structure for JSON operations.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				bool ioError = false;             ///< true when the file could not be read/written

				/// @brief Check if an error occurred
				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					ioError = false;
				}
			};

			struct ParseOptions {
				bool allowComments = false;        ///< Allow // and /* */ comments
				size_t maxDepth = MAX_JSON_DEPTH;  ///< Maximum nesting depth
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 4;              ///< Number of spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			// ============================================================================
			// Text
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 * @return true on success, false on parse error or excessive depth
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			/**
			 * @brief Serialize Json object to string.
			 *
			 * Invalid UTF-8 is replaced rather than reported.
			 */
			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// Files
			// ============================================================================

			/// @brief The text without a leading UTF-8 byte order mark
			[[nodiscard]] std::string_view StripUtf8Bom(std::string_view text) noexcept;

			/**
			 * @brief Load JSON from file (size and depth limited, UTF-8 BOM stripped).
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Save JSON to file with atomic replacement.
			 *
			 * Creates parent directories if they don't exist.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const StringifyOptions& opt = {}) noexcept;

			// ============================================================================
			// Typed Getters
			// ============================================================================

			/**
			 * @brief Get a typed member of an object.
			 * @return true if the key exists and converts to T; out is unchanged otherwise
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view key, T& out) noexcept {
				try {
					if (!j.is_object()) {
						return false;
					}
					const auto it = j.find(std::string(key));
					if (it == j.end()) {
						return false;
					}
					out = it->template get<T>();
					return true;
				}
				catch (const Json::exception&) {
					return false;
				}
			}

			/**
			 * @brief Get a typed member or return default.
			 */
			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view key, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, key, val)) {
					return val;
				}
				return defaultValue;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace DomainSentry
