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
 * @file NetworkUtils.hpp
 * @brief HTTP/HTTPS client helpers built on libcurl.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace DomainSentry {
	namespace Utils {
		namespace NetworkUtils {

			// ============================================================================
			// HTTP/HTTPS Functionality
			// ============================================================================

			enum class HttpMethod {
				GET,
				POST,
				PUT,
				HEAD
			};

			struct HttpHeader {
				std::string name;
				std::string value;
			};

			struct HttpRequestOptions {
				HttpMethod method = HttpMethod::GET;
				std::vector<HttpHeader> headers;
				std::string body;
				std::string contentType = "application/octet-stream";
				uint32_t timeoutMs = 30000;          ///< Whole-transfer timeout
				uint32_t connectTimeoutMs = 0;       ///< 0 = same as timeoutMs
				bool allowRedirects = false;
				uint32_t maxRedirects = 5;
				bool verifySSL = true;
				std::string userAgent = "DomainSentry/1.0";
				std::string proxy;                   ///< Empty = libcurl environment defaults
				size_t maxResponseBytes = 4ULL * 1024 * 1024;
			};

			struct HttpResponse {
				uint32_t statusCode = 0;
				std::vector<HttpHeader> headers;
				std::string body;
				std::string contentType;

				/// @brief Case-insensitive header lookup (first match)
				[[nodiscard]] std::optional<std::string> FindHeader(std::string_view name) const;
			};

			/**
			 * @brief Transport-level failure class (no HTTP status was received).
			 */
			enum class TransportError : uint8_t {
				None = 0,
				Timeout,        ///< Connect or transfer exceeded the timeout
				Resolve,        ///< DNS resolution failed
				Connect,        ///< TCP connect refused/unreachable
				Tls,            ///< TLS handshake or certificate failure
				TooLarge,       ///< Response exceeded maxResponseBytes
				Other
			};

			struct Error {
				TransportError kind = TransportError::None;
				int curlCode = 0;
				std::string message;

				[[nodiscard]] bool hasError() const noexcept { return kind != TransportError::None; }
				void clear() noexcept { kind = TransportError::None; curlCode = 0; message.clear(); }
			};

			/**
			 * @brief Perform one HTTP request.
			 *
			 * Returns true whenever a complete HTTP response was received, whatever
			 * its status code. Returns false (and fills err) on transport failure.
			 * Never retries.
			 */
			[[nodiscard]] bool HttpRequest(std::string_view url, HttpResponse& response,
			                               const HttpRequestOptions& options = {},
			                               Error* err = nullptr) noexcept;

			[[nodiscard]] const char* TransportErrorName(TransportError kind) noexcept;

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace DomainSentry
