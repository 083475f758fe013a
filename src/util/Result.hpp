/**
 * @file Result.hpp
 * @brief Value-or-error return type used across the engine.
 *
 * Fallible operations return Result<T> instead of throwing. The Error carries
 * a code from the export error taxonomy plus enough context (segment index,
 * stage, asset) for a caller to report the failure precisely.
 */

#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "Types.hpp"

namespace rs {

enum class ErrorCode {
    Generic,
    InvalidInput,
    AssetLoad,
    Normalization,
    CodecNegotiation,
    Capture,
    Programming,
    Busy,
    Cancelled
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
    case ErrorCode::Generic:
        return "Error";
    case ErrorCode::InvalidInput:
        return "InvalidInput";
    case ErrorCode::AssetLoad:
        return "AssetLoadError";
    case ErrorCode::Normalization:
        return "NormalizationError";
    case ErrorCode::CodecNegotiation:
        return "CodecNegotiationError";
    case ErrorCode::Capture:
        return "CaptureError";
    case ErrorCode::Programming:
        return "ProgrammingError";
    case ErrorCode::Busy:
        return "Busy";
    case ErrorCode::Cancelled:
        return "Cancelled";
    }
    return "Error";
}

struct Error {
    ErrorCode code{ErrorCode::Generic};
    std::string message;
    std::optional<usize> segmentIndex;
    std::string stage;
    std::string asset;

    Error() = default;
    Error(std::string msg) : message(std::move(msg)) {
    }
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {
    }

    Error& atSegment(usize index) {
        segmentIndex = index;
        return *this;
    }
    Error& inStage(std::string s) {
        stage = std::move(s);
        return *this;
    }
    Error& forAsset(std::string a) {
        asset = std::move(a);
        return *this;
    }

    // "CaptureError [compositing, segment 3]: message"
    std::string describe() const {
        std::string out = errorCodeName(code);
        if (!stage.empty() || segmentIndex) {
            out += " [";
            if (!stage.empty()) {
                out += stage;
            }
            if (segmentIndex) {
                if (!stage.empty()) {
                    out += ", ";
                }
                out += "segment " + std::to_string(*segmentIndex + 1);
            }
            out += "]";
        }
        out += ": " + message;
        if (!asset.empty()) {
            out += " (" + asset + ")";
        }
        return out;
    }
};

template <typename T>
class [[nodiscard]] Result {
public:
    static Result ok(T value) {
        return Result(std::move(value));
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }
    static Result err(std::string message) {
        return Result(Error(std::move(message)));
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error(code, std::move(message)));
    }

    bool isOk() const {
        return std::holds_alternative<T>(data_);
    }
    bool isErr() const {
        return !isOk();
    }
    explicit operator bool() const {
        return isOk();
    }

    T& value() & {
        return std::get<T>(data_);
    }
    const T& value() const& {
        return std::get<T>(data_);
    }
    T&& value() && {
        return std::get<T>(std::move(data_));
    }
    T& operator*() & {
        return value();
    }
    const T& operator*() const& {
        return value();
    }
    T&& operator*() && {
        return std::move(*this).value();
    }
    T* operator->() {
        return &value();
    }
    const T* operator->() const {
        return &value();
    }

    T valueOr(T fallback) const {
        return isOk() ? value() : std::move(fallback);
    }

    Error& error() {
        return std::get<Error>(data_);
    }
    const Error& error() const {
        return std::get<Error>(data_);
    }

private:
    explicit Result(T value) : data_(std::move(value)) {
    }
    explicit Result(Error error) : data_(std::move(error)) {
    }

    std::variant<T, Error> data_;
};

template <>
class [[nodiscard]] Result<void> {
public:
    static Result ok() {
        return Result();
    }
    static Result err(Error error) {
        return Result(std::move(error));
    }
    static Result err(std::string message) {
        return Result(Error(std::move(message)));
    }
    static Result err(ErrorCode code, std::string message) {
        return Result(Error(code, std::move(message)));
    }

    bool isOk() const {
        return !error_.has_value();
    }
    bool isErr() const {
        return error_.has_value();
    }
    explicit operator bool() const {
        return isOk();
    }

    Error& error() {
        return *error_;
    }
    const Error& error() const {
        return *error_;
    }

private:
    Result() = default;
    explicit Result(Error error) : error_(std::move(error)) {
    }

    std::optional<Error> error_;
};

} // namespace rs
