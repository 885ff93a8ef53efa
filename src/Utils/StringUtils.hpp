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
 * @file StringUtils.hpp
 * @brief ASCII string helpers and hostname normalization.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace DomainSentry {
	namespace Utils {
		namespace StringUtils {

			/// Longest hostname accepted (RFC 1035 presentation form)
			inline constexpr size_t MAX_HOSTNAME_LENGTH = 253;

			[[nodiscard]] std::string ToLowerAscii(std::string_view s);

			[[nodiscard]] std::string_view TrimView(std::string_view s) noexcept;

			[[nodiscard]] std::string Trim(std::string_view s);

			[[nodiscard]] bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;

			/**
			 * @brief True for dotted IPv4 literals and (already unbracketed) IPv6 literals.
			 */
			[[nodiscard]] bool IsIpLiteral(std::string_view host) noexcept;

			/**
			 * @brief Reduce a URL, authority or bare host to a lowercase hostname.
			 *
			 * Strips scheme, userinfo, path/query/fragment, port, IPv6 brackets and
			 * a trailing dot. Validates length and the [a-z0-9-_.] alphabet
			 * (IP literals pass through).
			 *
			 * @param input Raw host header, SNI value or URL
			 * @param out Receives the hostname (cleared on failure)
			 * @return false when nothing valid remains
			 */
			[[nodiscard]] bool NormalizeHost(std::string_view input, std::string& out);

			/**
			 * @brief Registrable domain of a normalized hostname.
			 *
			 * "www.news.bbc.co.uk" -> "bbc.co.uk", "api.github.com" -> "github.com".
			 * IP literals, single-label hosts and bare public suffixes are returned
			 * unchanged. Suffixes come from the Public Suffix List via libpsl.
			 */
			[[nodiscard]] std::string RegistrableDomain(std::string_view host);

			/**
			 * @brief Escape &, <, >, " and ' for HTML text and attribute contexts.
			 */
			[[nodiscard]] std::string HtmlEscape(std::string_view s);

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace DomainSentry
