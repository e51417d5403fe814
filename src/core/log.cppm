/**
 * @file log.cppm
 * @brief clustermc logging module - std::format based, no external backend
 *
 * Usage:
 *   import clustermc.core.log;
 *
 *   logger::init("myapp", logger::level::debug);
 *   logger::info("discovered {} nodes", n);
 *   logger::warn("invalidating cluster state: {}", err.message());
 *   // [timestamp] [level] [thread_id] [file:line] message
 *
 *   // File output, one JSON object per line
 *   logger::init_with_file("myapp", "logs/app.log",
 *                          logger::level::info, logger::output_format::json);
 */
module;

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

export module clustermc.core.log;

import std;

export namespace logger {

    // ============================================================================
    // Log level / output format
    // ============================================================================
    enum class level {
        trace    = 0,
        debug    = 1,
        info     = 2,
        warn     = 3,
        error    = 4,
        critical = 5,
        off      = 6
    };

    enum class output_format {
        text,
        json
    };

    // ============================================================================
    // Internal implementation
    // ============================================================================
    namespace detail {
        inline level& current_level() {
            static level lv = level::info;
            return lv;
        }

        inline output_format& current_format() {
            static output_format fmt = output_format::text;
            return fmt;
        }

        inline std::string& logger_name() {
            static std::string name = "clustermc";
            return name;
        }

        inline std::mutex& log_mutex() {
            static std::mutex mtx;
            return mtx;
        }

        inline std::ofstream& log_file() {
            static std::ofstream file;
            return file;
        }

        inline bool& file_enabled() {
            static bool enabled = false;
            return enabled;
        }

        inline bool& console_enabled() {
            static bool enabled = true;
            return enabled;
        }

        inline const char* level_to_string(level lv) {
            switch (lv) {
                case level::trace:    return "trace";
                case level::debug:    return "debug";
                case level::info:     return "info";
                case level::warn:     return "warn";
                case level::error:    return "error";
                case level::critical: return "critical";
                default:              return "unknown";
            }
        }

        // Windows consoles need VT processing switched on explicitly
        inline bool& ansi_enabled() {
            static bool enabled = false;
            return enabled;
        }

        inline bool try_enable_ansi() {
#ifdef _WIN32
            HANDLE h = GetStdHandle(STD_ERROR_HANDLE);
            if (h == INVALID_HANDLE_VALUE) return false;
            DWORD mode = 0;
            if (!GetConsoleMode(h, &mode)) return false;
            return SetConsoleMode(h, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
            return true;
#endif
        }

        inline std::string level_colored(level lv) {
            if (!ansi_enabled()) {
                return level_to_string(lv);
            }
            switch (lv) {
                case level::trace:    return "\033[37mtrace\033[0m";
                case level::debug:    return "\033[36mdebug\033[0m";
                case level::info:     return "\033[32minfo\033[0m";
                case level::warn:     return "\033[33mwarn\033[0m";
                case level::error:    return "\033[31merror\033[0m";
                case level::critical: return "\033[35mcritical\033[0m";
                default:              return "unknown";
            }
        }

        inline std::string get_timestamp() {
            using namespace std::chrono;
            // UTC, decomposed by hand: no gmtime_r, no time zone database
            auto now  = system_clock::now();
            auto dp   = floor<days>(now);
            year_month_day ymd{dp};
            auto tod  = now - dp;
            auto h    = floor<hours>(tod);      tod -= h;
            auto mn   = floor<minutes>(tod);    tod -= mn;
            auto s    = floor<seconds>(tod);    tod -= s;
            auto ms   = floor<milliseconds>(tod);
            return std::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}",
                static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()),
                h.count(), mn.count(), s.count(), ms.count());
        }

        inline std::string get_thread_id() {
            std::ostringstream oss;
            oss << std::this_thread::get_id();
            return oss.str();
        }

        inline std::string_view extract_filename(std::string_view path) {
            if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
                return path.substr(pos + 1);
            }
            return path;
        }

        inline std::string json_escape(std::string_view in) {
            std::string out;
            out.reserve(in.size() + 8);
            for (char c : in) {
                switch (c) {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n";  break;
                    case '\r': out += "\\r";  break;
                    case '\t': out += "\\t";  break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20)
                            out += std::format("\\u{:04x}", static_cast<unsigned>(c));
                        else
                            out += c;
                }
            }
            return out;
        }

        inline std::string format_line(level lv, bool colored,
                                       std::string_view timestamp,
                                       std::string_view thread_id,
                                       std::string_view source,
                                       std::string_view message) {
            if (current_format() == output_format::json) {
                return std::format(
                    "{{\"timestamp\":\"{}\",\"level\":\"{}\",\"logger\":\"{}\","
                    "\"thread\":\"{}\",\"source\":\"{}\",\"message\":\"{}\"}}",
                    timestamp, level_to_string(lv), json_escape(logger_name()),
                    thread_id, json_escape(source), json_escape(message));
            }
            auto lv_str = colored ? level_colored(lv) : std::string(level_to_string(lv));
            if (source.empty())
                return std::format("[{}] [{}] [{}] {}", timestamp, lv_str, thread_id, message);
            return std::format("[{}] [{}] [{}] [{}] {}",
                               timestamp, lv_str, thread_id, source, message);
        }

        inline void write_log(level lv, std::string_view message,
                              const std::source_location& loc = std::source_location::current()) {
            if (lv < current_level()) return;

            auto timestamp = get_timestamp();
            auto thread_id = get_thread_id();
            auto source = std::format("{}:{}", extract_filename(loc.file_name()), loc.line());

            std::lock_guard<std::mutex> lock(log_mutex());

            if (console_enabled()) {
                std::println(std::cerr, "{}",
                    format_line(lv, true, timestamp, thread_id, source, message));
            }

            if (file_enabled() && log_file().is_open()) {
                log_file() << format_line(lv, false, timestamp, thread_id, source, message) << '\n';
                log_file().flush();
            }
        }

        /// Embeds source_location in the format argument; MSVC cannot deduce
        /// "variadic pack + trailing defaulted source_location"
        template<typename... Args>
        struct fmt_loc {
            std::format_string<Args...> fmt;
            std::source_location loc;

            template<typename S>
            consteval fmt_loc(const S& s,
                const std::source_location& l = std::source_location::current())
                : fmt(s), loc(l) {}
        };
    }

    // ============================================================================
    // Initialization
    // ============================================================================

    inline void init(const std::string& name = "clustermc", level lv = level::info) {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::logger_name() = name;
        detail::current_level() = lv;
        detail::console_enabled() = true;
        detail::file_enabled() = false;
        detail::ansi_enabled() = detail::try_enable_ansi();
    }

    /**
     * @brief Console + file output
     * @param filepath appended to, created if missing
     */
    inline void init_with_file(const std::string& name,
                               const std::string& filepath,
                               level lv = level::info,
                               output_format fmt = output_format::text) {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::logger_name() = name;
        detail::current_level() = lv;
        detail::current_format() = fmt;
        detail::console_enabled() = true;
        if (detail::log_file().is_open())
            detail::log_file().close();
        detail::log_file().open(filepath, std::ios::app);
        detail::file_enabled() = detail::log_file().is_open();
        detail::ansi_enabled() = detail::try_enable_ansi();
    }

    // ============================================================================
    // Runtime configuration
    // ============================================================================

    inline void set_level(level lv) {
        detail::current_level() = lv;
    }

    inline void set_format(output_format fmt) {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::current_format() = fmt;
    }

    inline void set_console(bool enabled) {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        detail::console_enabled() = enabled;
    }

    inline void flush() {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        if (detail::file_enabled() && detail::log_file().is_open()) {
            detail::log_file().flush();
        }
    }

    inline void shutdown() {
        std::lock_guard<std::mutex> lock(detail::log_mutex());
        if (detail::log_file().is_open()) {
            detail::log_file().close();
        }
        detail::file_enabled() = false;
    }

    // ============================================================================
    // Log functions (std::format + std::source_location)
    // Each level is a struct so the defaulted source_location can sit next to
    // the variadic arguments
    // ============================================================================

    struct trace {
        template<typename... Args>
        trace(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::trace, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        trace(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::trace, msg, loc);
        }
    };

    struct debug {
        template<typename... Args>
        debug(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::debug, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        debug(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::debug, msg, loc);
        }
    };

    struct info {
        template<typename... Args>
        info(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::info, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        info(std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::info, msg, loc);
        }
    };

    struct warn {
        template<typename... Args>
        warn(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::warn, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        warn(std::string_view msg,
             const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::warn, msg, loc);
        }
    };

    struct error {
        template<typename... Args>
        error(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::error, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        error(std::string_view msg,
              const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::error, msg, loc);
        }
    };

    struct critical {
        template<typename... Args>
        critical(detail::fmt_loc<std::type_identity_t<Args>...> fl, Args&&... args) {
            detail::write_log(level::critical, std::format(fl.fmt, std::forward<Args>(args)...), fl.loc);
        }
        critical(std::string_view msg,
                 const std::source_location& loc = std::source_location::current()) {
            detail::write_log(level::critical, msg, loc);
        }
    };

} // namespace logger
