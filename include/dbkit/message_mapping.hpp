// Copyright (c) 2024 liudegui. MIT License.
//
// dbkit::MessageMapping -- record <-> protobuf message conversion.
//
// Design:
//   - CRTP capability: a record type derives from
//     MessageMapping<Record, RecordProto> and shadows SetMessage() and
//     FromMessage(); the defaults report kNotImplemented
//   - ToMessage() always starts from a cleared message
//   - FromSerializedFile() picks the wire format from the file suffix:
//     ".pb" binary, ".json" JSON, anything else protobuf text format

#pragma once

#include <fstream>
#include <iterator>
#include <string>

#include <google/protobuf/text_format.h>
#include <google/protobuf/util/json_util.h>

#include "dbkit/error.hpp"
#include "dbkit/value.hpp"

namespace dbkit {

// ---------------------------------------------------------------------------
// MessageMapping
// ---------------------------------------------------------------------------

template <typename Derived, typename MessageT>
class MessageMapping {
 public:
  using Message = MessageT;

  /// Fill `*out` from this record.
  Error ToMessage(MessageT* out) const {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "Null message");
    }
    out->Clear();
    return static_cast<const Derived*>(this)->SetMessage(out);
  }

  /// Record fields carried by `message`. Record types shadow this.
  static Error FromMessage(const MessageT& /*message*/, Fields* /*out*/) {
    return Error::Format(ErrorCode::kNotImplemented,
                         "FromMessage not implemented for %s",
                         MessageT::descriptor()->full_name().c_str());
  }

  /// Parse a serialized `MessageT` from `path` and map it to fields.
  static Error FromSerializedFile(const std::string& path, Fields* out) {
    MessageT message;
    Error err = ParseFile(path, &message);
    if (!err.ok()) { return err; }
    return Derived::FromMessage(message, out);
  }

  /// Copy the record into a cleared `*out`. Record types shadow this.
  Error SetMessage(MessageT* /*out*/) const {
    return Error::Format(ErrorCode::kNotImplemented,
                         "SetMessage not implemented for %s",
                         MessageT::descriptor()->full_name().c_str());
  }

 private:
  static bool EndsWith(const std::string& s, const char* suffix) {
    std::string tail(suffix);
    return s.size() >= tail.size() &&
           s.compare(s.size() - tail.size(), tail.size(), tail) == 0;
  }

  static Error ParseFile(const std::string& path, MessageT* message) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      return Error::Format(ErrorCode::kDeserialization, "Cannot open '%s'",
                           path.c_str());
    }

    bool ok = false;
    if (EndsWith(path, ".pb")) {
      ok = message->ParseFromIstream(&in);
    } else {
      std::string text((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
      if (EndsWith(path, ".json")) {
        ok = google::protobuf::util::JsonStringToMessage(text, message).ok();
      } else {
        ok = google::protobuf::TextFormat::ParseFromString(text, message);
      }
    }
    if (!ok) {
      return Error::Format(ErrorCode::kDeserialization,
                           "Cannot parse %s from '%s'",
                           MessageT::descriptor()->full_name().c_str(),
                           path.c_str());
    }
    return Error::Ok();
  }
};

}  // namespace dbkit
