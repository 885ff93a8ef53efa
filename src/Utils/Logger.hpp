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
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logger with console/file targets,
 *        size based rotation and optional JSON Lines output.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace DomainSentry {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/**
		 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "fatal").
		 * @return true if the name was recognized
		 */
		[[nodiscard]] bool ParseLogLevel(const std::string& name, LogLevel& out) noexcept;

		/// @brief Upper-case level name used in log prefixes.
		[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to console (stderr)
			bool toFile = true;             ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";            ///< Log file directory
			std::string baseFileName = "DomainSentry";    ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                     ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;       ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;        ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.logDirectory = "logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   DS_LOG_INFO("Classifier", "Resolved %s -> %s", domain.c_str(), category.c_str());
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note If Initialize() is never called the logger auto-initializes with
		 *       console-only, synchronous defaults on first use.
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Re-initializing an initialized logger flushes and restarts it with
			 * the new configuration.
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 */
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/// @brief Messages discarded by the back-pressure policy since start.
			[[nodiscard]] uint64_t DroppedCount() const noexcept { return m_dropped.load(); }

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts;
			};

			void EnsureInitialized();
			void StartLocked();
			void StopWorker();
			void WorkerLoop();
			void Enqueue(LogItem&& item);
			void Dispatch(const LogItem& item);

			void WriteConsole(const LogItem& item);
			void WriteFile(const LogItem& item);

			[[nodiscard]] std::string FormatLine(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);
			[[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point tp);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			std::atomic<bool> m_initialized{ false };
			std::atomic<bool> m_configured{ false };  ///< Initialize() was called; no console auto-start
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };
			std::atomic<uint64_t> m_dropped{ 0 };
			// Copies of m_cfg fields read by Enqueue without m_cfgMutex
			std::atomic<size_t> m_maxQueueSize{ 1000 };
			std::atomic<LoggerConfig::BackPressurePolicy> m_bpPolicy{ LoggerConfig::BackPressurePolicy::DropOldest };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;
			std::condition_variable m_spaceCv;
			std::thread m_worker;
			bool m_stop = false;
			size_t m_inFlight = 0;

			/// Serializes sink writes (console + file) between worker and sync callers
			std::mutex m_writeMutex;
			std::FILE* m_file = nullptr;
			uint64_t m_currentSize = 0;
		};

	}  // namespace Utils
}  // namespace DomainSentry

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// Usage:
//   DS_LOG_INFO("Category", "Message with %d format", value);
//   DS_LOG_ERROR("Category", "Error occurred: %s", errorMsg.c_str());
//   DS_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define DS_LOG_AT(level, category, fmt, ...) \
    do { \
        auto& _lg = ::DomainSentry::Utils::Logger::Instance(); \
        if (_lg.IsEnabled(level)) { \
            _lg.LogEx((level), (category), __FILE__, __LINE__, __FUNCTION__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define DS_LOG_TRACE(category, fmt, ...) DS_LOG_AT(::DomainSentry::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define DS_LOG_DEBUG(category, fmt, ...) DS_LOG_AT(::DomainSentry::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define DS_LOG_INFO(category, fmt, ...)  DS_LOG_AT(::DomainSentry::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define DS_LOG_WARN(category, fmt, ...)  DS_LOG_AT(::DomainSentry::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define DS_LOG_ERROR(category, fmt, ...) DS_LOG_AT(::DomainSentry::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define DS_LOG_FATAL(category, fmt, ...) DS_LOG_AT(::DomainSentry::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define DS_LOG_CONCAT_INNER(a, b) a##b
#define DS_LOG_CONCAT(a, b) DS_LOG_CONCAT_INNER(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define DS_LOG_SCOPE(category) \
    ::DomainSentry::Utils::Logger::Scope DS_LOG_CONCAT(_ds_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __FUNCTION__)
