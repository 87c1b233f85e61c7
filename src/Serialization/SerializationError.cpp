// @file SerializationError.cpp

#include "Serialization/SerializationError.hpp"

#include <utility>

namespace kirikae::serialization {

std::string_view toString(SerializationErrorKind kind) {
    switch (kind) {
    case SerializationErrorKind::NotAnObject:            return "NotAnObject";
    case SerializationErrorKind::MissingDiscriminator:   return "MissingDiscriminator";
    case SerializationErrorKind::MalformedDiscriminator: return "MalformedDiscriminator";
    case SerializationErrorKind::UnhandledCase:          return "UnhandledCase";
    case SerializationErrorKind::IncompatibleCase:       return "IncompatibleCase";
    case SerializationErrorKind::UnexpectedToken:        return "UnexpectedToken";
    case SerializationErrorKind::EncodeUnsupported:      return "EncodeUnsupported";
    }
    return "Unknown";
}

SerializationError::SerializationError(SerializationErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

UnhandledCaseError::UnhandledCaseError(std::string typeName, std::string caseText)
    : SerializationError(SerializationErrorKind::UnhandledCase,
          "Cannot deserialize " + typeName + " from JSON object due to unhandled case: " + caseText + "."),
      typeName_(std::move(typeName)),
      caseText_(std::move(caseText)) {}

}  // namespace kirikae::serialization
