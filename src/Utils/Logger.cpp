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
#include "Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <unistd.h>

namespace DomainSentry {
	namespace Utils {

		namespace fs = std::filesystem;

		// ============================================================================
		// Level helpers
		// ============================================================================

		bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept {
			std::string lower;
			lower.reserve(name.size());
			for (char c : name) {
				lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
			}

			if (lower == "trace") { out = LogLevel::Trace; return true; }
			if (lower == "debug") { out = LogLevel::Debug; return true; }
			if (lower == "info")  { out = LogLevel::Info;  return true; }
			if (lower == "warn" || lower == "warning") { out = LogLevel::Warn; return true; }
			if (lower == "error") { out = LogLevel::Error; return true; }
			if (lower == "fatal") { out = LogLevel::Fatal; return true; }
			return false;
		}

		const char* LogLevelName(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			default:              return "UNKNOWN";
			}
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			m_configured.store(true);
			if (m_initialized.load()) {
				ShutDown();
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			{
				// Sinks read m_cfg under m_writeMutex.
				std::lock_guard<std::mutex> wlock(m_writeMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) {
					m_cfg.maxQueueSize = 1;
				}
			}
			m_minLevel.store(cfg.minimalLevel);
			m_maxQueueSize.store(m_cfg.maxQueueSize);
			m_bpPolicy.store(m_cfg.bpPolicy);
			StartLocked();
		}

		void Logger::EnsureInitialized() {
			if (m_initialized.load(std::memory_order_acquire) || m_configured.load()) {
				return;
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_initialized.load() || m_configured.load()) {
				return;
			}

			// Console-only synchronous defaults
			{
				std::lock_guard<std::mutex> wlock(m_writeMutex);
				m_cfg.async = false;
				m_cfg.toFile = false;
				m_cfg.toConsole = true;
			}
			StartLocked();
		}

		void Logger::StartLocked() {
			{
				std::lock_guard<std::mutex> qlock(m_queueMutex);
				m_stop = false;
				m_queue.clear();
				m_inFlight = 0;
			}

			if (m_cfg.toFile) {
				std::lock_guard<std::mutex> wlock(m_writeMutex);
				OpenLogFileIfNeeded();
			}

			if (m_cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false)) {
				return;
			}

			StopWorker();

			std::lock_guard<std::mutex> wlock(m_writeMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		void Logger::StopWorker() {
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop = true;
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load();
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load());
		}

		// ============================================================================
		// Logging entry points
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) {
				return {};
			}

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) {
				return {};
			}

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsEnabled(level)) {
				return;
			}

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsEnabled(level)) {
				return;
			}

			EnsureInitialized();

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();

			bool async = false;
			LogLevel flushLevel = LogLevel::Error;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
				flushLevel = m_cfg.flushLevel;
			}

			if (async) {
				Enqueue(std::move(item));
				if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(flushLevel)) {
					Flush();
				}
			} else {
				Dispatch(item);
			}
		}

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);
			if (m_stop) {
				lock.unlock();
				Dispatch(item);
				return;
			}

			const size_t maxQueueSize = m_maxQueueSize.load();
			if (m_queue.size() >= maxQueueSize) {
				switch (m_bpPolicy.load()) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [this] {
						return m_stop || m_queue.size() < m_maxQueueSize.load();
					});
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					m_dropped.fetch_add(1);
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					m_dropped.fetch_add(1);
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] { return m_stop || !m_queue.empty(); });

					if (m_queue.empty()) {
						if (m_stop) {
							return;
						}
						continue;
					}

					item = std::move(m_queue.front());
					m_queue.pop_front();
					++m_inFlight;
				}
				m_spaceCv.notify_one();

				Dispatch(item);

				{
					std::lock_guard<std::mutex> lock(m_queueMutex);
					--m_inFlight;
				}
				m_queueCv.notify_all();
			}
		}

		void Logger::Flush() {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				if (m_worker.joinable() && !m_stop) {
					m_queueCv.wait(lock, [this] { return m_stop || (m_queue.empty() && m_inFlight == 0); });
				}
			}

			std::lock_guard<std::mutex> wlock(m_writeMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::fflush(stderr);
		}

		void Logger::Dispatch(const LogItem& item) {
			bool toConsole = false;
			bool toFile = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				toConsole = m_cfg.toConsole;
				toFile = m_cfg.toFile;
			}

			std::lock_guard<std::mutex> wlock(m_writeMutex);
			if (toConsole) {
				WriteConsole(item);
			}
			if (toFile) {
				WriteFile(item);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::WriteConsole(const LogItem& item) {
			const std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatLine(item);
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const LogItem& item) {
			OpenLogFileIfNeeded();
			if (!m_file) {
				return;
			}

			std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatLine(item);
			line.push_back('\n');

			RotateIfNeeded(line.size());
			if (!m_file) {
				return;
			}

			const size_t written = std::fwrite(line.data(), 1, line.size(), m_file);
			m_currentSize += written;

			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				std::fflush(m_file);
			}
		}

		std::string Logger::BaseLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) {
				return;
			}

			std::error_code ec;
			fs::create_directories(m_cfg.logDirectory, ec);
			if (ec) {
				std::fprintf(stderr, "Logger: cannot create log directory '%s': %s\n",
				             m_cfg.logDirectory.c_str(), ec.message().c_str());
				return;
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "Logger: cannot open log file '%s': %s\n",
				             path.c_str(), std::strerror(errno));
				return;
			}

			const auto size = fs::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) {
				return;
			}
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
				return;
			}
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file) {
				std::fclose(m_file);
				m_file = nullptr;
			}

			const std::string base = BaseLogPath();
			std::error_code ec;

			// base.log.(N-1) is dropped, base.log.i -> base.log.(i+1), base.log -> base.log.1
			const size_t keep = std::max<size_t>(m_cfg.maxFileCount, 1);
			fs::remove(base + "." + std::to_string(keep), ec);
			for (size_t i = keep; i > 1; --i) {
				const std::string from = base + "." + std::to_string(i - 1);
				if (fs::exists(from, ec)) {
					fs::rename(from, base + "." + std::to_string(i), ec);
				}
			}
			fs::rename(base, base + ".1", ec);

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point tp) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
			const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm tm{};
			gmtime_r(&t, &tm);

			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
			              tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
			              tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
			return buf;
		}

		std::string Logger::FormatLine(const LogItem& item) const {
			std::ostringstream os;
			os << FormatIso8601UTC(item.ts) << " [" << LogLevelName(item.level) << "]";
			if (m_cfg.includeProcThreadId) {
				os << " [" << item.pid << ":" << std::hex << (item.tid & 0xFFFFFFu) << std::dec << "]";
			}
			if (!item.category.empty()) {
				os << " [" << item.category << "]";
			}
			os << " " << item.message;
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				const auto slash = item.file.find_last_of('/');
				os << " (" << (slash == std::string::npos ? item.file : item.file.substr(slash + 1))
				   << ":" << item.line << " " << item.function << ")";
			}
			return os.str();
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (unsigned char c : s) {
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n";  break;
				case '\r': out += "\\r";  break;
				case '\t': out += "\\t";  break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					} else {
						out.push_back(static_cast<char>(c));
					}
					break;
				}
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::ostringstream os;
			os << "{\"ts\":\"" << FormatIso8601UTC(item.ts) << "\""
			   << ",\"level\":\"" << LogLevelName(item.level) << "\""
			   << ",\"category\":\"" << EscapeJson(item.category) << "\""
			   << ",\"message\":\"" << EscapeJson(item.message) << "\"";
			if (m_cfg.includeProcThreadId) {
				os << ",\"pid\":" << item.pid << ",\"tid\":" << item.tid;
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				os << ",\"file\":\"" << EscapeJson(item.file) << "\""
				   << ",\"line\":" << item.line
				   << ",\"function\":\"" << EscapeJson(item.function) << "\"";
			}
			os << "}";
			return os.str();
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category),
			  m_file(file),
			  m_function(function),
			  m_line(line),
			  m_start(std::chrono::steady_clock::now()),
			  m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsEnabled(m_level)) {
				lg.LogEx(m_level, m_category, m_file, m_line, m_function, "%s", messageOnEnter);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (lg.IsEnabled(m_level)) {
				const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
					std::chrono::steady_clock::now() - m_start).count();
				lg.LogEx(m_level, m_category, m_file, m_line, m_function,
				         "Exit (%lld us)", static_cast<long long>(us));
			}
		}

	}  // namespace Utils
}  // namespace DomainSentry
