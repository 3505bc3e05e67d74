#pragma once
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace OC {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        Cycle,
        NoSuchField,
        NoSuchSource,
        IndexOutOfRange,
        InvalidPath,
        TypeMismatch,
        DuplicateOwnership,
        DuplicateSource,
        UnresolvedDependency,
        EmptyField,
        MalformedInput,
        UnserializableType,
        NotSupported,
        SourceDataMissing,
        NoSuchRecord,
        TransportFailure,
        DerivationFailed
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::vector<std::size_t> failed)
        : code(c), message(std::move(m)), indices(std::move(failed)) {}

    Code                       code;
    std::optional<std::string> message;
    // Argument positions that could not be resolved (UnresolvedDependency only).
    std::vector<std::size_t>   indices;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::Cycle:
        return "cycle";
    case Error::Code::NoSuchField:
        return "no_such_field";
    case Error::Code::NoSuchSource:
        return "no_such_source";
    case Error::Code::IndexOutOfRange:
        return "index_out_of_range";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::DuplicateOwnership:
        return "duplicate_ownership";
    case Error::Code::DuplicateSource:
        return "duplicate_source";
    case Error::Code::UnresolvedDependency:
        return "unresolved_dependency";
    case Error::Code::EmptyField:
        return "empty_field";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::UnserializableType:
        return "unserializable_type";
    case Error::Code::NotSupported:
        return "not_supported";
    case Error::Code::SourceDataMissing:
        return "source_data_missing";
    case Error::Code::NoSuchRecord:
        return "no_such_record";
    case Error::Code::TransportFailure:
        return "transport_failure";
    case Error::Code::DerivationFailed:
        return "derivation_failed";
    }
    return "unknown_error";
}

// Lookup failures share one family: a missing field, source slot, position or path segment.
[[nodiscard]] inline auto isLookupError(Error const& error) -> bool {
    switch (error.code) {
    case Error::Code::NoSuchField:
    case Error::Code::NoSuchSource:
    case Error::Code::IndexOutOfRange:
    case Error::Code::InvalidPath:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    std::string description{label};
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    if (!error.indices.empty()) {
        description.append(" [");
        for (std::size_t i = 0; i < error.indices.size(); ++i) {
            if (i > 0)
                description.push_back(',');
            description.append(std::to_string(error.indices[i]));
        }
        description.push_back(']');
    }
    return description;
}

} // namespace OC
