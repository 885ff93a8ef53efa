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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

namespace DomainSentry {
	namespace Utils {
		namespace JSON {

			namespace {

				void FillError(Error* err, const std::string& msg, size_t offset = 0) {
					if (err) {
						err->message = msg;
						err->byteOffset = offset;
					}
				}

				size_t Depth(const Json& j, size_t limit, size_t current = 1) {
					if (current > limit) {
						return current;
					}
					size_t deepest = current;
					if (j.is_object() || j.is_array()) {
						for (const auto& child : j) {
							deepest = std::max(deepest, Depth(child, limit, current + 1));
							if (deepest > limit) {
								break;
							}
						}
					}
					return deepest;
				}

			}  // namespace

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				try {
					out = Json::parse(jsonText.begin(), jsonText.end(), nullptr, true, opt.allowComments);
				}
				catch (const Json::parse_error& e) {
					out = Json();
					FillError(err, e.what(), e.byte);
					return false;
				}
				catch (const std::exception& e) {
					out = Json();
					FillError(err, e.what());
					return false;
				}

				if (opt.maxDepth > 0 && Depth(out, opt.maxDepth) > opt.maxDepth) {
					out = Json();
					FillError(err, "JSON nesting depth exceeds limit");
					return false;
				}
				return true;
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					out = j.dump(opt.pretty ? opt.indentSpaces : -1, ' ', opt.ensureAscii,
					             Json::error_handler_t::replace);
					return true;
				}
				catch (const std::exception&) {
					out.clear();
					return false;
				}
			}

			std::string_view StripUtf8Bom(std::string_view text) noexcept {
				if (text.size() >= 3 &&
				    static_cast<unsigned char>(text[0]) == 0xEF &&
				    static_cast<unsigned char>(text[1]) == 0xBB &&
				    static_cast<unsigned char>(text[2]) == 0xBF) {
					text.remove_prefix(3);
				}
				return text;
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				std::string text;
				FileUtils::Error ferr;
				if (!FileUtils::ReadAllText(path, text, &ferr, maxBytes)) {
					if (err) {
						err->message = ferr.message;
						err->path = path;
						err->ioError = true;
					}
					return false;
				}

				if (!Parse(StripUtf8Bom(text), out, err, opt)) {
					if (err) {
						err->path = path;
					}
					return false;
				}
				return true;
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err,
			                const StringifyOptions& opt) noexcept {
				std::string text;
				if (!Stringify(j, text, opt)) {
					FillError(err, "JSON serialization failed");
					if (err) err->path = path;
					return false;
				}
				text.push_back('\n');

				FileUtils::Error ferr;
				if (!FileUtils::WriteAllTextAtomic(path, text, &ferr)) {
					if (err) {
						err->message = ferr.message;
						err->path = path;
						err->ioError = true;
					}
					return false;
				}
				return true;
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace DomainSentry
