#pragma once
#include "retrochat/core/result.hpp"
#include "retrochat/core/failures.hpp"
#include <string>
#include <string_view>
namespace google::protobuf {
class Message;
}
namespace retrochat::vault::proto_json {

/** camelCase JSON; scalar fields are printed even when they hold the default value. */
Result<std::string, VaultFailure> Serialize(const google::protobuf::Message& message);

/**
 * Parses `json` into `message`. With `allow_unknown_fields` false any
 * key that does not map to a field is a Decode failure.
 */
Result<Unit, VaultFailure> Parse(
    std::string_view json,
    google::protobuf::Message& message,
    bool allow_unknown_fields = true);

}
