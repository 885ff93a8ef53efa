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
#include "pch.h"
#include "StringUtils.hpp"

#include <cctype>
#include <memory>

#include <libpsl.h>

namespace DomainSentry {
	namespace Utils {
		namespace StringUtils {

			namespace {

				struct PslContextDeleter {
					void operator()(psl_ctx_t* ctx) const noexcept { psl_free(ctx); }
				};

				// System Public Suffix List when it is newer than the one compiled into libpsl.
				const psl_ctx_t* SuffixList() {
					static const std::unique_ptr<psl_ctx_t, PslContextDeleter> s_latest(psl_latest(nullptr));
					return s_latest ? s_latest.get() : psl_builtin();
				}

				bool IsHostChar(char c) noexcept {
					return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
				}

				bool IsIPv4(std::string_view s) noexcept {
					int parts = 0;
					size_t i = 0;
					while (i <= s.size()) {
						size_t j = i;
						int value = 0;
						while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) {
							value = value * 10 + (s[j] - '0');
							if (value > 255 || j - i >= 3) return false;
							++j;
						}
						if (j == i) return false;
						++parts;
						if (j == s.size()) break;
						if (s[j] != '.') return false;
						i = j + 1;
					}
					return parts == 4;
				}

				bool IsIPv6(std::string_view s) noexcept {
					if (s.find(':') == std::string_view::npos) return false;
					for (char c : s) {
						if (!(std::isxdigit(static_cast<unsigned char>(c)) || c == ':' || c == '.')) {
							return false;
						}
					}
					return true;
				}

			}  // namespace

			std::string ToLowerAscii(std::string_view s) {
				std::string out(s);
				for (auto& c : out) {
					c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
				}
				return out;
			}

			std::string_view TrimView(std::string_view s) noexcept {
				size_t b = 0;
				size_t e = s.size();
				while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
				while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
				return s.substr(b, e - b);
			}

			std::string Trim(std::string_view s) {
				return std::string(TrimView(s));
			}

			bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept {
				if (a.size() != b.size()) return false;
				for (size_t i = 0; i < a.size(); ++i) {
					if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
						return false;
					}
				}
				return true;
			}

			bool IsIpLiteral(std::string_view host) noexcept {
				return IsIPv4(host) || IsIPv6(host);
			}

			bool NormalizeHost(std::string_view input, std::string& out) {
				out.clear();
				std::string_view s = TrimView(input);

				// scheme://
				if (const auto pos = s.find("://"); pos != std::string_view::npos) {
					s.remove_prefix(pos + 3);
				}

				// path, query, fragment
				if (const auto pos = s.find_first_of("/?#"); pos != std::string_view::npos) {
					s = s.substr(0, pos);
				}

				// userinfo@
				if (const auto pos = s.rfind('@'); pos != std::string_view::npos) {
					s.remove_prefix(pos + 1);
				}

				std::string_view host;
				if (!s.empty() && s.front() == '[') {
					const auto close = s.find(']');
					if (close == std::string_view::npos) return false;
					host = s.substr(1, close - 1);
				} else if (std::count(s.begin(), s.end(), ':') == 1) {
					host = s.substr(0, s.find(':'));
				} else {
					// Bare IPv6 literal (several colons) or plain host
					host = s;
				}

				while (!host.empty() && host.back() == '.') {
					host.remove_suffix(1);
				}

				if (host.empty() || host.size() > MAX_HOSTNAME_LENGTH) {
					return false;
				}

				std::string lowered = ToLowerAscii(host);
				if (IsIpLiteral(lowered)) {
					out = std::move(lowered);
					return true;
				}

				if (lowered.front() == '.' || lowered.find("..") != std::string::npos) {
					return false;
				}
				for (char c : lowered) {
					if (!IsHostChar(c)) {
						return false;
					}
				}

				out = std::move(lowered);
				return true;
			}

			std::string RegistrableDomain(std::string_view host) {
				if (host.empty() || IsIpLiteral(host)) {
					return std::string(host);
				}

				const psl_ctx_t* psl = SuffixList();
				if (psl == nullptr) {
					return std::string(host);
				}

				// Public suffixes themselves ("co.uk") and single labels have no registrable part.
				const std::string name(host);
				const char* registrable = psl_registrable_domain(psl, name.c_str());
				return registrable != nullptr ? std::string(registrable) : name;
			}

			std::string HtmlEscape(std::string_view s) {
				std::string out;
				out.reserve(s.size() + 16);
				for (char c : s) {
					switch (c) {
					case '&':  out += "&amp;";  break;
					case '<':  out += "&lt;";   break;
					case '>':  out += "&gt;";   break;
					case '"':  out += "&quot;"; break;
					case '\'': out += "&#39;";  break;
					default:   out.push_back(c); break;
					}
				}
				return out;
			}

		}  // namespace StringUtils
	}  // namespace Utils
}  // namespace DomainSentry
