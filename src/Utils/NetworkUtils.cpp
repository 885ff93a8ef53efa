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
#include "NetworkUtils.hpp"
#include "Logger.hpp"

#include <cctype>
#include <mutex>

#include <curl/curl.h>

namespace DomainSentry {
	namespace Utils {
		namespace NetworkUtils {

			namespace {

				void EnsureCurlGlobalInit() {
					static std::once_flag s_once;
					std::call_once(s_once, [] {
						const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
						if (rc != CURLE_OK) {
							DS_LOG_ERROR("NetworkUtils", "curl_global_init failed: %s", curl_easy_strerror(rc));
						}
					});
				}

				struct CurlEasyDeleter {
					void operator()(CURL* h) const noexcept { if (h) curl_easy_cleanup(h); }
				};

				struct CurlSlistDeleter {
					void operator()(curl_slist* l) const noexcept { if (l) curl_slist_free_all(l); }
				};

				struct TransferState {
					HttpResponse* response = nullptr;
					size_t maxBytes = 0;
					bool tooLarge = false;
				};

				size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
					auto* state = static_cast<TransferState*>(userdata);
					const size_t bytes = size * nmemb;
					if (state->response->body.size() + bytes > state->maxBytes) {
						state->tooLarge = true;
						return 0;
					}
					state->response->body.append(ptr, bytes);
					return bytes;
				}

				std::string Trim(std::string_view s) {
					size_t b = 0;
					size_t e = s.size();
					while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
					while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
					return std::string(s.substr(b, e - b));
				}

				size_t HeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
					auto* state = static_cast<TransferState*>(userdata);
					const size_t bytes = size * nitems;
					std::string_view line(buffer, bytes);

					// A new status line (redirect or 100-continue) resets collected headers
					if (line.rfind("HTTP/", 0) == 0) {
						state->response->headers.clear();
						return bytes;
					}

					const auto colon = line.find(':');
					if (colon != std::string_view::npos) {
						state->response->headers.push_back({ Trim(line.substr(0, colon)), Trim(line.substr(colon + 1)) });
					}
					return bytes;
				}

				TransportError Classify(CURLcode rc) noexcept {
					switch (rc) {
					case CURLE_OPERATION_TIMEDOUT:
						return TransportError::Timeout;
					case CURLE_COULDNT_RESOLVE_HOST:
					case CURLE_COULDNT_RESOLVE_PROXY:
						return TransportError::Resolve;
					case CURLE_COULDNT_CONNECT:
					case CURLE_SEND_ERROR:
					case CURLE_RECV_ERROR:
					case CURLE_GOT_NOTHING:
						return TransportError::Connect;
					case CURLE_SSL_CONNECT_ERROR:
					case CURLE_PEER_FAILED_VERIFICATION:
					case CURLE_SSL_CERTPROBLEM:
					case CURLE_SSL_CIPHER:
					case CURLE_SSL_CACERT_BADFILE:
						return TransportError::Tls;
					default:
						return TransportError::Other;
					}
				}

			}  // namespace

			std::optional<std::string> HttpResponse::FindHeader(std::string_view name) const {
				for (const auto& h : headers) {
					if (h.name.size() != name.size()) continue;
					bool same = true;
					for (size_t i = 0; i < name.size(); ++i) {
						if (std::tolower(static_cast<unsigned char>(h.name[i])) !=
						    std::tolower(static_cast<unsigned char>(name[i]))) {
							same = false;
							break;
						}
					}
					if (same) return h.value;
				}
				return std::nullopt;
			}

			const char* TransportErrorName(TransportError kind) noexcept {
				switch (kind) {
				case TransportError::None:     return "None";
				case TransportError::Timeout:  return "Timeout";
				case TransportError::Resolve:  return "Resolve";
				case TransportError::Connect:  return "Connect";
				case TransportError::Tls:      return "Tls";
				case TransportError::TooLarge: return "TooLarge";
				default:                       return "Other";
				}
			}

			bool HttpRequest(std::string_view url, HttpResponse& response,
			                 const HttpRequestOptions& options, Error* err) noexcept {
				response = HttpResponse{};
				if (err) err->clear();

				try {
					EnsureCurlGlobalInit();

					std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
					if (!curl) {
						if (err) {
							err->kind = TransportError::Other;
							err->message = "curl_easy_init failed";
						}
						return false;
					}

					const std::string urlStr(url);
					CURL* h = curl.get();
					TransferState state;
					state.response = &response;
					state.maxBytes = options.maxResponseBytes;

					curl_easy_setopt(h, CURLOPT_URL, urlStr.c_str());
					curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
					curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options.timeoutMs));
					curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
					                 static_cast<long>(options.connectTimeoutMs ? options.connectTimeoutMs : options.timeoutMs));
					curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, options.allowRedirects ? 1L : 0L);
					curl_easy_setopt(h, CURLOPT_MAXREDIRS, static_cast<long>(options.maxRedirects));
					curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options.verifySSL ? 1L : 0L);
					curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options.verifySSL ? 2L : 0L);
					curl_easy_setopt(h, CURLOPT_USERAGENT, options.userAgent.c_str());
					curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &WriteCallback);
					curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
					curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &HeaderCallback);
					curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
					if (!options.proxy.empty()) {
						curl_easy_setopt(h, CURLOPT_PROXY, options.proxy.c_str());
					}

					switch (options.method) {
					case HttpMethod::GET:
						curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
						break;
					case HttpMethod::HEAD:
						curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
						break;
					case HttpMethod::POST:
						curl_easy_setopt(h, CURLOPT_POST, 1L);
						curl_easy_setopt(h, CURLOPT_POSTFIELDS, options.body.data());
						curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(options.body.size()));
						break;
					case HttpMethod::PUT:
						curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
						curl_easy_setopt(h, CURLOPT_POSTFIELDS, options.body.data());
						curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(options.body.size()));
						break;
					}

					std::unique_ptr<curl_slist, CurlSlistDeleter> headerList;
					auto append = [&headerList](const std::string& line) {
						curl_slist* next = curl_slist_append(headerList.get(), line.c_str());
						if (next) {
							headerList.release();
							headerList.reset(next);
						}
					};
					if (!options.body.empty()) {
						append("Content-Type: " + options.contentType);
					}
					for (const auto& hdr : options.headers) {
						append(hdr.name + ": " + hdr.value);
					}
					if (headerList) {
						curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
					}

					const CURLcode rc = curl_easy_perform(h);
					if (rc != CURLE_OK) {
						if (err) {
							err->kind = state.tooLarge ? TransportError::TooLarge : Classify(rc);
							err->curlCode = static_cast<int>(rc);
							err->message = curl_easy_strerror(rc);
						}
						return false;
					}

					long status = 0;
					curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
					response.statusCode = static_cast<uint32_t>(status);

					char* ct = nullptr;
					if (curl_easy_getinfo(h, CURLINFO_CONTENT_TYPE, &ct) == CURLE_OK && ct) {
						response.contentType = ct;
					}
					return true;
				}
				catch (const std::exception& e) {
					if (err) {
						err->kind = TransportError::Other;
						err->message = e.what();
					}
					return false;
				}
			}

		}  // namespace NetworkUtils
	}  // namespace Utils
}  // namespace DomainSentry
