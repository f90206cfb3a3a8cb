#pragma once

#include <stdexcept>
#include <string>

namespace rsvp_reader {

/// No page of a supplied document contained any extractable text.
/// Ingestion is rejected and the active document stays in place.
class EmptyDocumentError : public std::runtime_error {
public:
  explicit EmptyDocumentError(const std::string& what) : std::runtime_error(what) {}
};

/// A seek target outside the document's page range.
class OutOfRangeError : public std::out_of_range {
public:
  explicit OutOfRangeError(const std::string& what) : std::out_of_range(what) {}
};

/// A non-positive reading speed or chunk size.
class InvalidParameterError : public std::invalid_argument {
public:
  explicit InvalidParameterError(const std::string& what) : std::invalid_argument(what) {}
};

/// The document parser could not make sense of the uploaded bytes.
class DocumentParseError : public std::runtime_error {
public:
  explicit DocumentParseError(const std::string& what) : std::runtime_error(what) {}
};

/// Configuration file missing, malformed, or holding invalid values.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace rsvp_reader
