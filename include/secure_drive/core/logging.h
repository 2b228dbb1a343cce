// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "secure_drive/config/feature_flags.h"

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace secure_drive {

/**
 * @brief Log categories for the encrypted transfer pipeline
 */
struct log_category {
    static constexpr std::string_view key_store = "secure_drive.key_store";
    static constexpr std::string_view codec = "secure_drive.codec";
    static constexpr std::string_view job = "secure_drive.job";
    static constexpr std::string_view orchestrator = "secure_drive.orchestrator";
    static constexpr std::string_view progress = "secure_drive.progress";
    static constexpr std::string_view upload = "secure_drive.upload";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name such as "info" or "WARN"
 * @return Parsed level, or std::nullopt for unknown names
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") return log_level::trace;
    if (upper == "DEBUG") return log_level::debug;
    if (upper == "INFO") return log_level::info;
    if (upper == "WARN" || upper == "WARNING") return log_level::warn;
    if (upper == "ERROR") return log_level::error;
    if (upper == "FATAL") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Masking of user file locations in log output
 */
struct masking_config {
    bool mask_paths = false;
    bool mask_filenames = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks directory components and file names in log messages
 *
 * Source files are user documents; their locations are personal data.
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Mask every path found in a free-form message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_paths) {
            return input;
        }

        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    /**
     * @brief Mask the directory part of a path, and the file name if enabled
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return config_.mask_filenames ? mask_filename(path) : path;
        }
        if (!config_.mask_paths) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        std::string filename = path.substr(last_sep + 1);

        if (config_.mask_filenames) {
            filename = mask_filename(filename);
        }

        return masked_dir + "/" + filename;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (filename.size() <= config_.visible_chars) {
            return filename;
        }

        auto dot_pos = filename.find('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            std::string name = filename.substr(0, dot_pos);
            std::string ext = filename.substr(dot_pos);

            if (name.size() <= config_.visible_chars) {
                return filename;
            }

            std::string masked(name.size() - config_.visible_chars, config_.mask_char[0]);
            return name.substr(0, config_.visible_chars) + masked + ext;
        }

        std::string masked(filename.size() - config_.visible_chars, config_.mask_char[0]);
        return filename.substr(0, config_.visible_chars) + masked;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for key, codec and transfer operations
 *
 * Never carries key material; keys are identified by fingerprint only.
 */
struct transfer_log_context {
    std::optional<uint64_t> batch_id;
    std::optional<uint64_t> job_id;
    std::string filename;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_processed;
    std::optional<std::string> state;
    std::optional<double> progress_percent;
    std::optional<double> throughput_bps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> key_fingerprint;
    std::optional<std::string> remote_id;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };
        auto add_double = [&](const char* name, double value) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2);
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (batch_id) add_uint("batch_id", *batch_id);
        if (job_id) add_uint("job_id", *job_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_path(filename) : filename);
        }
        if (file_size) add_uint("size", *file_size);
        if (bytes_processed) add_uint("bytes_processed", *bytes_processed);
        if (state) add_field("state", *state);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (throughput_bps) add_double("throughput_bps", *throughput_bps);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (key_fingerprint) add_field("key_fingerprint", *key_fingerprint);
        if (remote_id) add_field("remote_id", *remote_id);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::orchestrator)
 *     .with_message("Upload completed")
 *     .with_job_id(3)
 *     .with_filename("report.pdf")
 *     .with_file_size(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_batch_id(uint64_t id) -> log_entry_builder& {
        ensure_context();
        entry_.context->batch_id = id;
        return *this;
    }

    auto with_job_id(uint64_t id) -> log_entry_builder& {
        ensure_context();
        entry_.context->job_id = id;
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context();
        entry_.context->filename = std::string(filename);
        return *this;
    }

    auto with_file_size(uint64_t size) -> log_entry_builder& {
        ensure_context();
        entry_.context->file_size = size;
        return *this;
    }

    auto with_bytes_processed(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_processed = bytes;
        return *this;
    }

    auto with_key_fingerprint(std::string_view fingerprint) -> log_entry_builder& {
        ensure_context();
        entry_.context->key_fingerprint = std::string(fingerprint);
        return *this;
    }

    auto with_error_message(std::string_view message) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(message);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class transfer_logger;

transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the pipeline
 *
 * Writes to logger_system when it is compiled in, to stderr otherwise.
 * Callbacks receive every enabled message regardless of backend.
 */
class transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called by key_store and
     * transfer_orchestrator construction.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Suppress stderr output while keeping callbacks active
     *
     * Used by tests that capture log output through callbacks.
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {

        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            write_json(builder.build(), current_masker);
        } else {
            write_text(level, category, message, context, file, line, function, current_masker);
        }
    }

    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            current_masker = masker_;
        }
        write_json(entry, current_masker);
    }

    void flush() {
#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write_json(const structured_log_entry& entry, const sensitive_info_masker& masker) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (entry.source_file && entry.source_line && entry.function_name) {
                logger_->log(to_logger_level(entry.level), json_str,
                             entry.source_file->c_str(), *entry.source_line,
                             entry.function_name->c_str());
            } else {
                logger_->log(to_logger_level(entry.level), json_str);
            }
            return;
        }
#endif
        output_to_stderr(json_str);
    }

    void write_text(log_level level,
                    std::string_view category,
                    std::string_view message,
                    const transfer_log_context* context,
                    [[maybe_unused]] const char* file,
                    [[maybe_unused]] int line,
                    [[maybe_unused]] const char* function,
                    const sensitive_info_masker& masker) {
        std::ostringstream oss;
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), oss.str(), file, line, function);
            } else {
                logger_->log(to_logger_level(level), oss.str());
            }
            return;
        }
#endif
        output_to_stderr(get_timestamp() + " [" + std::string(log_level_to_string(level)) + "] " + oss.str());
    }

    void output_to_stderr(const std::string& msg) {
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if SECURE_DRIVE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

#define SD_LOG(level, category, message) \
    ::secure_drive::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define SD_LOG_CTX(level, category, message, context) \
    ::secure_drive::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define SD_LOG_TRACE(category, message) \
    SD_LOG(::secure_drive::log_level::trace, category, message)

#define SD_LOG_DEBUG(category, message) \
    SD_LOG(::secure_drive::log_level::debug, category, message)

#define SD_LOG_INFO(category, message) \
    SD_LOG(::secure_drive::log_level::info, category, message)

#define SD_LOG_WARN(category, message) \
    SD_LOG(::secure_drive::log_level::warn, category, message)

#define SD_LOG_ERROR(category, message) \
    SD_LOG(::secure_drive::log_level::error, category, message)

#define SD_LOG_FATAL(category, message) \
    SD_LOG(::secure_drive::log_level::fatal, category, message)

#define SD_LOG_DEBUG_CTX(category, message, ctx) \
    SD_LOG_CTX(::secure_drive::log_level::debug, category, message, ctx)

#define SD_LOG_INFO_CTX(category, message, ctx) \
    SD_LOG_CTX(::secure_drive::log_level::info, category, message, ctx)

#define SD_LOG_WARN_CTX(category, message, ctx) \
    SD_LOG_CTX(::secure_drive::log_level::warn, category, message, ctx)

#define SD_LOG_ERROR_CTX(category, message, ctx) \
    SD_LOG_CTX(::secure_drive::log_level::error, category, message, ctx)

}  // namespace secure_drive
