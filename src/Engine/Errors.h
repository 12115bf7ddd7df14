#pragma once

#include <stdexcept>
#include <string>

// Base of every typed failure a redline run can end with.
struct RedlinerError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Corrupt container, unsupported zip feature, or a resource limit exceeded.
struct ArchiveError : RedlinerError {
  using RedlinerError::RedlinerError;
};

// word/document.xml absent from an input package.
struct MissingPartError : RedlinerError {
  using RedlinerError::RedlinerError;
};

// existingTrackedRevisionsPolicy == Fail and the revised input carries markup.
struct PolicyViolationError : RedlinerError {
  using RedlinerError::RedlinerError;
};

// A part is not well-formed XML. The engine turns this into a warning.
struct PartParseError : RedlinerError {
  using RedlinerError::RedlinerError;
};
