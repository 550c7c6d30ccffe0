#pragma once
#include "courier/core/result.hpp"
#include "courier/core/failures.hpp"
#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <set>
#include <string>
#include <string_view>
namespace courier::protocol::utilities {

/**
 * JSON mapping of protobuf messages (lowerCamelCase names, base64 bytes).
 *
 * Printing always emits primitive fields, so `false`, `0` and empty
 * strings are present on the wire. 64-bit integers are printed as JSON
 * numbers rather than protobuf's quoted strings; they must stay within
 * 2^53 to keep every digit. Parsing accepts both forms and ignores
 * unknown fields.
 */
class JsonCodec {
public:
    enum class Style {
        Full,
        /// Full, indented for people
        Pretty,
        OmitDefaults
    };

    [[nodiscard]] static Result<std::string, ProtocolFailure> Print(
        const google::protobuf::Message& message,
        Style style = Style::Full) {
        google::protobuf::util::JsonPrintOptions options;
        options.always_print_primitive_fields = style != Style::OmitDefaults;
        options.add_whitespace = style == Style::Pretty;
        options.always_print_enums_as_ints = true;
        options.preserve_proto_field_names = false;
        std::string out;
        auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
        if (!status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to encode JSON: " + status.ToString()));
        }
        std::set<const google::protobuf::Descriptor*> visited;
        if (!HasWideIntegers(message.GetDescriptor(), visited)) {
            return Result<std::string, ProtocolFailure>::Ok(std::move(out));
        }

        google::protobuf::Struct object;
        status = google::protobuf::util::JsonStringToMessage(out, &object);
        if (!status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to re-read encoded JSON: " + status.ToString()));
        }
        WideIntegersAsNumbers(message, object);
        out.clear();
        status = google::protobuf::util::MessageToJsonString(object, &out, options);
        if (!status.ok()) {
            return Result<std::string, ProtocolFailure>::Err(
                ProtocolFailure::Encode("Failed to encode JSON: " + status.ToString()));
        }
        return Result<std::string, ProtocolFailure>::Ok(std::move(out));
    }

    /// Parses into `message`; a schema mismatch reports ProtocolFailureType::Decode.
    [[nodiscard]] static Result<Unit, ProtocolFailure> Parse(
        std::string_view json,
        google::protobuf::Message& message) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = true;
        const std::string input(json);
        const auto status = google::protobuf::util::JsonStringToMessage(input, &message, options);
        if (!status.ok()) {
            return Result<Unit, ProtocolFailure>::Err(
                ProtocolFailure::Decode(std::string(status.message())));
        }
        return Result<Unit, ProtocolFailure>::Ok(unit);
    }

    template<typename M>
    [[nodiscard]] static Result<M, ProtocolFailure> ParseAs(std::string_view json) {
        M message;
        auto parsed = Parse(json, message);
        if (parsed.IsErr()) {
            return Result<M, ProtocolFailure>::Err(parsed.UnwrapErr());
        }
        return Result<M, ProtocolFailure>::Ok(std::move(message));
    }

    /// True when `json` is a syntactically valid JSON object.
    [[nodiscard]] static bool IsJsonObject(std::string_view json) {
        google::protobuf::Struct object;
        return Parse(json, object).IsOk();
    }

private:
    using FieldDescriptor = google::protobuf::FieldDescriptor;

    [[nodiscard]] static bool IsWideInteger(const FieldDescriptor* field) {
        return field->cpp_type() == FieldDescriptor::CPPTYPE_INT64 ||
               field->cpp_type() == FieldDescriptor::CPPTYPE_UINT64;
    }

    // Well-known types have their own JSON forms and are left alone.
    [[nodiscard]] static bool IsWellKnown(const google::protobuf::Descriptor* descriptor) {
        return descriptor->file()->package() == "google.protobuf";
    }

    [[nodiscard]] static bool HasWideIntegers(
        const google::protobuf::Descriptor* descriptor,
        std::set<const google::protobuf::Descriptor*>& visited) {
        if (IsWellKnown(descriptor) || !visited.insert(descriptor).second) {
            return false;
        }
        for (int i = 0; i < descriptor->field_count(); ++i) {
            const auto* field = descriptor->field(i);
            if (field->is_map()) {
                continue;
            }
            if (IsWideInteger(field)) {
                return true;
            }
            if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE &&
                HasWideIntegers(field->message_type(), visited)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] static double WideIntegerAt(
        const google::protobuf::Message& message,
        const FieldDescriptor* field,
        const int index) {
        const auto* reflection = message.GetReflection();
        if (field->cpp_type() == FieldDescriptor::CPPTYPE_INT64) {
            return static_cast<double>(index < 0
                ? reflection->GetInt64(message, field)
                : reflection->GetRepeatedInt64(message, field, index));
        }
        return static_cast<double>(index < 0
            ? reflection->GetUInt64(message, field)
            : reflection->GetRepeatedUInt64(message, field, index));
    }

    /// Rewrites the 64-bit fields of `object`, the JSON image of `message`, as numbers.
    static void WideIntegersAsNumbers(const google::protobuf::Message& message, google::protobuf::Struct& object) {
        const auto* descriptor = message.GetDescriptor();
        const auto* reflection = message.GetReflection();
        auto& fields = *object.mutable_fields();
        for (int i = 0; i < descriptor->field_count(); ++i) {
            const auto* field = descriptor->field(i);
            const auto found = fields.find(field->json_name());
            if (found == fields.end() || field->is_map()) {
                continue;
            }
            auto& value = found->second;
            if (IsWideInteger(field)) {
                if (!field->is_repeated()) {
                    value.set_number_value(WideIntegerAt(message, field, -1));
                    continue;
                }
                auto* items = value.mutable_list_value();
                for (int j = 0; j < reflection->FieldSize(message, field) && j < items->values_size(); ++j) {
                    items->mutable_values(j)->set_number_value(WideIntegerAt(message, field, j));
                }
            } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE && !IsWellKnown(field->message_type())) {
                if (!field->is_repeated()) {
                    if (value.has_struct_value()) {
                        WideIntegersAsNumbers(reflection->GetMessage(message, field), *value.mutable_struct_value());
                    }
                    continue;
                }
                auto* items = value.mutable_list_value();
                for (int j = 0; j < reflection->FieldSize(message, field) && j < items->values_size(); ++j) {
                    if (items->values(j).has_struct_value()) {
                        WideIntegersAsNumbers(reflection->GetRepeatedMessage(message, field, j),
                                              *items->mutable_values(j)->mutable_struct_value());
                    }
                }
            }
        }
    }

    JsonCodec() = delete;
};
}
