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
#include "FileUtils.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace DomainSentry {
	namespace Utils {
		namespace FileUtils {

			namespace fs = std::filesystem;

			namespace {

				void SetError(Error* err, int code, const std::string& what) {
					if (err) {
						err->errnoValue = code;
						err->message = what + (code ? (": " + std::string(std::strerror(code))) : std::string());
					}
				}

				/// Closes a descriptor on scope exit unless released.
				class FdGuard {
				public:
					explicit FdGuard(int fd) noexcept : m_fd(fd) {}
					~FdGuard() { if (m_fd >= 0) ::close(m_fd); }
					FdGuard(const FdGuard&) = delete;
					FdGuard& operator=(const FdGuard&) = delete;

					[[nodiscard]] int get() const noexcept { return m_fd; }
					int release() noexcept { int fd = m_fd; m_fd = -1; return fd; }

				private:
					int m_fd;
				};

				bool WriteFully(int fd, const char* data, size_t len) noexcept {
					while (len > 0) {
						const ssize_t n = ::write(fd, data, len);
						if (n < 0) {
							if (errno == EINTR) continue;
							return false;
						}
						data += n;
						len -= static_cast<size_t>(n);
					}
					return true;
				}

				void SyncDirectory(const fs::path& dir) noexcept {
					const std::string d = dir.empty() ? std::string(".") : dir.string();
					const int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
					if (fd >= 0) {
						(void)::fsync(fd);
						::close(fd);
					}
				}

				std::string MakeTempName(const fs::path& target) {
					static std::atomic<uint64_t> s_counter{ 0 };
					return target.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
					       std::to_string(s_counter.fetch_add(1));
				}

			}  // namespace

			bool Exists(const fs::path& path) noexcept {
				std::error_code ec;
				return fs::exists(path, ec);
			}

			FileIdentity GetFileIdentity(const fs::path& path) noexcept {
				FileIdentity id;
				struct stat st {};
				if (::stat(path.c_str(), &st) != 0) {
					return id;
				}
				id.exists = true;
				id.device = static_cast<uint64_t>(st.st_dev);
				id.inode = static_cast<uint64_t>(st.st_ino);
				id.size = static_cast<uint64_t>(st.st_size);
				id.mtimeNs = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL +
				             static_cast<int64_t>(st.st_mtim.tv_nsec);
				id.ctimeNs = static_cast<int64_t>(st.st_ctim.tv_sec) * 1000000000LL +
				             static_cast<int64_t>(st.st_ctim.tv_nsec);
				return id;
			}

			bool ReadAllText(const fs::path& path, std::string& out, Error* err, size_t maxBytes) noexcept {
				out.clear();

				const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
				if (fd < 0) {
					SetError(err, errno, "open '" + path.string() + "'");
					return false;
				}
				FdGuard guard(fd);

				struct stat st {};
				if (::fstat(fd, &st) != 0) {
					SetError(err, errno, "fstat '" + path.string() + "'");
					return false;
				}
				if (static_cast<uint64_t>(st.st_size) > maxBytes) {
					SetError(err, EFBIG, "file '" + path.string() + "' exceeds size limit");
					return false;
				}

				try {
					out.reserve(static_cast<size_t>(st.st_size));
					char buf[8192];
					for (;;) {
						const ssize_t n = ::read(fd, buf, sizeof(buf));
						if (n < 0) {
							if (errno == EINTR) continue;
							SetError(err, errno, "read '" + path.string() + "'");
							out.clear();
							return false;
						}
						if (n == 0) break;
						if (out.size() + static_cast<size_t>(n) > maxBytes) {
							SetError(err, EFBIG, "file '" + path.string() + "' exceeds size limit");
							out.clear();
							return false;
						}
						out.append(buf, static_cast<size_t>(n));
					}
				}
				catch (const std::bad_alloc&) {
					SetError(err, ENOMEM, "read '" + path.string() + "'");
					out.clear();
					return false;
				}
				return true;
			}

			bool WriteAllTextAtomic(const fs::path& path, std::string_view text, Error* err) noexcept {
				try {
					const fs::path dir = path.parent_path();
					if (!dir.empty()) {
						std::error_code ec;
						fs::create_directories(dir, ec);
						if (ec) {
							SetError(err, ec.value(), "create directory '" + dir.string() + "'");
							return false;
						}
					}

					const fs::path tmp = (dir.empty() ? fs::path(".") : dir) / MakeTempName(path);

					const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
					if (fd < 0) {
						SetError(err, errno, "create temp '" + tmp.string() + "'");
						return false;
					}

					{
						FdGuard guard(fd);
						if (!WriteFully(fd, text.data(), text.size())) {
							const int code = errno;
							::unlink(tmp.c_str());
							SetError(err, code, "write temp '" + tmp.string() + "'");
							return false;
						}
						if (::fsync(fd) != 0) {
							const int code = errno;
							::unlink(tmp.c_str());
							SetError(err, code, "fsync temp '" + tmp.string() + "'");
							return false;
						}
						if (::close(guard.release()) != 0) {
							const int code = errno;
							::unlink(tmp.c_str());
							SetError(err, code, "close temp '" + tmp.string() + "'");
							return false;
						}
					}

					if (::rename(tmp.c_str(), path.c_str()) != 0) {
						const int code = errno;
						::unlink(tmp.c_str());
						SetError(err, code, "rename to '" + path.string() + "'");
						return false;
					}

					SyncDirectory(dir);
					return true;
				}
				catch (const std::exception& e) {
					SetError(err, EIO, std::string("atomic write failed: ") + e.what());
					return false;
				}
			}

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace DomainSentry
