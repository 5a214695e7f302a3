#include "retrochat/core/proto_json.hpp"
#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

namespace retrochat::vault::proto_json {
    Result<std::string, VaultFailure> Serialize(const google::protobuf::Message& message) {
        google::protobuf::util::JsonPrintOptions options;
        options.always_print_primitive_fields = true;
        options.add_whitespace = false;
        std::string out;
        const auto status = google::protobuf::util::MessageToJsonString(message, &out, options);
        if (!status.ok()) {
            return Result<std::string, VaultFailure>::Err(
                VaultFailure::Encode("Failed to serialize " + message.GetTypeName() + ": " + status.ToString()));
        }
        return Result<std::string, VaultFailure>::Ok(std::move(out));
    }

    Result<Unit, VaultFailure> Parse(
        const std::string_view json,
        google::protobuf::Message& message,
        const bool allow_unknown_fields) {
        google::protobuf::util::JsonParseOptions options;
        options.ignore_unknown_fields = allow_unknown_fields;
        message.Clear();
        const auto status = google::protobuf::util::JsonStringToMessage(std::string(json), &message, options);
        if (!status.ok()) {
            return Result<Unit, VaultFailure>::Err(
                VaultFailure::Decode("Failed to parse " + message.GetTypeName() + ": " + status.ToString()));
        }
        return Result<Unit, VaultFailure>::Ok(Unit{});
    }
}
