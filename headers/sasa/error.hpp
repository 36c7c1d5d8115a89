//
// Created by gregorian-rayne on 12/28/25.
//

#ifndef SASA_ERROR_HPP
#define SASA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error value carried by Result<T, Error>.
 *
 * Errors stop an analysis before it produces a report: unusable input, bad
 * options, unreadable files or configuration. Structural faults inside
 * otherwise valid SAS text are anomalies instead (see types.hpp).
 *
 * @code
 *     auto result = sasa::analyzers::analyze("   ");
 *     // result.error().to_string() == "[InvalidArgument] source text is empty"
 * @endcode
 */

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace sasa {

    enum class ErrorCode {
        InvalidArgument,  ///< Unusable source text or options
        NotFound,         ///< Input or config file missing
        ParseError,       ///< Malformed JSON or TOML
        IoError,          ///< Read or write failed
        ConfigError,      ///< Configuration value rejected
        AnalysisError,    ///< An analyzer could not finish
        InternalError
    };

    constexpr std::string_view error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * A code, a human readable message and optional context (usually the
     * file, source name or config key involved).
     */
    class Error {
    public:
        using Context = std::optional<std::string>;

        Error(const ErrorCode code, std::string message, Context context = std::nullopt)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, Context context = std::nullopt) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message, Context context = std::nullopt) {
            return {ErrorCode::InternalError, std::move(message), std::move(context)};
        }

        [[nodiscard]] ErrorCode code() const noexcept { return code_; }
        [[nodiscard]] const std::string& message() const noexcept { return message_; }
        [[nodiscard]] const Context& context() const noexcept { return context_; }
        [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }

        /// Copy with @p more appended to the context, separated by "; ".
        [[nodiscard]] Error with_context(const std::string_view more) const {
            std::string combined = context_ ? *context_ + "; " : std::string{};
            combined += more;
            return {code_, message_, std::move(combined)};
        }

        /// "[Code] message" plus " (context: ...)" when context is present.
        [[nodiscard]] std::string to_string() const {
            std::string text = "[" + std::string(error_code_to_string(code_)) + "] " + message_;
            if (context_) {
                text += " (context: " + *context_ + ")";
            }
            return text;
        }

        bool operator==(const Error&) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        Context context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace sasa

#endif //SASA_ERROR_HPP
